#ifndef SPATIALINDEX_H
#define SPATIALINDEX_H

#include <QRectF>
#include <QVector>

#include <vector>

/**
 * @brief SpatialIndex - Bounding box index over integer items (GEOS STRtree)
 *
 * Items are inserted with their bounding box; query() returns every item
 * whose box intersects the query box, in ascending item order. The tree is
 * packed lazily on the first query after an insert, so bulk loading is
 * cheap. Degenerate boxes (points, axis-parallel lines) are supported.
 */
class SpatialIndex {
public:
    SpatialIndex();
    ~SpatialIndex();

    SpatialIndex(const SpatialIndex&) = delete;
    SpatialIndex& operator=(const SpatialIndex&) = delete;

    void insert(int item, const QRectF& bounds);
    void clear();

    QVector<int> query(const QRectF& rect) const;

    int size() const { return m_entries.size(); }
    bool isEmpty() const { return m_entries.isEmpty(); }

private:
    struct Entry {
        int item;
        QRectF bounds;
    };

    void build() const;
    void releaseTree() const;
    void* createEnvelope(const QRectF& rect) const;

    QVector<Entry> m_entries;

    // GEOS context handle (owned)
    void* m_geosContext{nullptr};

    // Packed tree and the envelope geometries it references
    mutable void* m_tree{nullptr};
    mutable std::vector<void*> m_envelopes;
    mutable std::vector<int> m_items;
};

#endif // SPATIALINDEX_H
