#include "geometry/spatialindex.h"
#include "logging.h"

#include <geos_c.h>

#include <algorithm>
#include <cmath>

// STRtree node capacity (GEOS default)
static const size_t s_nodeCapacity = 10;

static void indexErrorHandler(const char* message, void* /*userdata*/) {
    qCWarning(lcGeos) << "GEOS index error:" << message;
}

static void collectItem(void* item, void* userdata)
{
    auto* hits = static_cast<QVector<int>*>(userdata);
    hits->append(*static_cast<const int*>(item));
}

static bool isFiniteRect(const QRectF& rect)
{
    return std::isfinite(rect.left()) && std::isfinite(rect.top()) &&
           std::isfinite(rect.right()) && std::isfinite(rect.bottom());
}

SpatialIndex::SpatialIndex()
{
    m_geosContext = GEOS_init_r();
    if (m_geosContext) {
        GEOSContext_setErrorMessageHandler_r(static_cast<GEOSContextHandle_t>(m_geosContext),
                                             indexErrorHandler, nullptr);
    } else {
        qCWarning(lcGeos) << "Spatial index: GEOS context initialization failed";
    }
}

SpatialIndex::~SpatialIndex()
{
    releaseTree();
    if (m_geosContext) {
        GEOS_finish_r(static_cast<GEOSContextHandle_t>(m_geosContext));
    }
}

void SpatialIndex::insert(int item, const QRectF& bounds)
{
    if (!isFiniteRect(bounds)) return;

    // A packed STRtree cannot take more items; rebuild on next query
    releaseTree();
    m_entries.append(Entry{item, bounds.normalized()});
}

void SpatialIndex::clear()
{
    releaseTree();
    m_entries.clear();
}

void SpatialIndex::releaseTree() const
{
    auto ctx = static_cast<GEOSContextHandle_t>(m_geosContext);
    if (!ctx) return;

    if (m_tree) {
        GEOSSTRtree_destroy_r(ctx, static_cast<GEOSSTRtree*>(m_tree));
        m_tree = nullptr;
    }
    for (void* env : m_envelopes) {
        GEOSGeom_destroy_r(ctx, static_cast<GEOSGeometry*>(env));
    }
    m_envelopes.clear();
    m_items.clear();
}

void* SpatialIndex::createEnvelope(const QRectF& rect) const
{
    auto ctx = static_cast<GEOSContextHandle_t>(m_geosContext);

    const double minX = rect.left();
    const double maxX = rect.right();
    const double minY = rect.top();
    const double maxY = rect.bottom();

    if (minX == maxX && minY == maxY) {
        GEOSCoordSequence* seq = GEOSCoordSeq_create_r(ctx, 1, 2);
        if (!seq) return nullptr;
        GEOSCoordSeq_setXY_r(ctx, seq, 0, minX, minY);
        GEOSGeometry* pt = GEOSGeom_createPoint_r(ctx, seq);
        if (!pt) GEOSCoordSeq_destroy_r(ctx, seq);
        return pt;
    }

    // Closed ring over the box corners; only its envelope is used
    GEOSCoordSequence* seq = GEOSCoordSeq_create_r(ctx, 5, 2);
    if (!seq) return nullptr;
    GEOSCoordSeq_setXY_r(ctx, seq, 0, minX, minY);
    GEOSCoordSeq_setXY_r(ctx, seq, 1, maxX, minY);
    GEOSCoordSeq_setXY_r(ctx, seq, 2, maxX, maxY);
    GEOSCoordSeq_setXY_r(ctx, seq, 3, minX, maxY);
    GEOSCoordSeq_setXY_r(ctx, seq, 4, minX, minY);

    GEOSGeometry* ring = GEOSGeom_createLinearRing_r(ctx, seq);
    if (!ring) GEOSCoordSeq_destroy_r(ctx, seq);
    return ring;
}

void SpatialIndex::build() const
{
    auto ctx = static_cast<GEOSContextHandle_t>(m_geosContext);
    if (!ctx || m_tree) return;

    GEOSSTRtree* tree = GEOSSTRtree_create_r(ctx, s_nodeCapacity);
    if (!tree) {
        qCWarning(lcGeos) << "Spatial index: failed to create STRtree";
        return;
    }

    // Item storage must not move once pointers are handed to the tree
    m_items.reserve(static_cast<size_t>(m_entries.size()));
    m_envelopes.reserve(static_cast<size_t>(m_entries.size()));

    for (const auto& entry : m_entries) {
        void* env = createEnvelope(entry.bounds);
        if (!env) continue;
        m_items.push_back(entry.item);
        m_envelopes.push_back(env);
        GEOSSTRtree_insert_r(ctx, tree, static_cast<const GEOSGeometry*>(env), &m_items.back());
    }

    m_tree = tree;
}

QVector<int> SpatialIndex::query(const QRectF& rect) const
{
    QVector<int> hits;
    auto ctx = static_cast<GEOSContextHandle_t>(m_geosContext);
    if (!ctx || m_entries.isEmpty() || !isFiniteRect(rect)) return hits;

    build();
    if (!m_tree) return hits;

    auto* queryEnv = static_cast<GEOSGeometry*>(createEnvelope(rect.normalized()));
    if (!queryEnv) return hits;

    GEOSSTRtree_query_r(ctx, static_cast<GEOSSTRtree*>(m_tree), queryEnv, collectItem, &hits);
    GEOSGeom_destroy_r(ctx, queryEnv);

    std::sort(hits.begin(), hits.end());
    return hits;
}
