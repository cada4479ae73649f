#include "polygon.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace sectionpath {

namespace {

double point_segment_distance(const Point2D& p, const Point2D& a, const Point2D& b) {
    Vec2 ab = b - a;
    double len_sq = ab.length_squared();
    if (len_sq == 0.0) {
        return p.distance_to(a);
    }
    double t = std::clamp((p - a).dot(ab) / len_sq, 0.0, 1.0);
    return p.distance_to(a + ab * t);
}

int orientation(const Point2D& a, const Point2D& b, const Point2D& c) {
    double v = (b - a).cross(c - a);
    if (v > 0.0) return 1;
    if (v < 0.0) return -1;
    return 0;
}

// Segments closer than tolerance (including crossing) are reported as touching
bool segments_touch(const Point2D& p1, const Point2D& p2,
                    const Point2D& q1, const Point2D& q2, double tolerance) {
    // Bounding box rejection
    if (std::max(p1.x, p2.x) + tolerance < std::min(q1.x, q2.x) ||
        std::max(q1.x, q2.x) + tolerance < std::min(p1.x, p2.x) ||
        std::max(p1.y, p2.y) + tolerance < std::min(q1.y, q2.y) ||
        std::max(q1.y, q2.y) + tolerance < std::min(p1.y, p2.y)) {
        return false;
    }

    int o1 = orientation(p1, p2, q1);
    int o2 = orientation(p1, p2, q2);
    int o3 = orientation(q1, q2, p1);
    int o4 = orientation(q1, q2, p2);
    if (o1 * o2 < 0 && o3 * o4 < 0) {
        return true;
    }

    double d = std::min({
        point_segment_distance(q1, p1, p2),
        point_segment_distance(q2, p1, p2),
        point_segment_distance(p1, q1, q2),
        point_segment_distance(p2, q1, q2)
    });
    return d <= tolerance;
}

// Edge i of a ring runs from r[i] to r[i + 1]; its x extent feeds the sweep
struct EdgeSpan {
    double min_x;
    double max_x;
    size_t ring;
    size_t index;
};

void append_spans(std::vector<EdgeSpan>& spans, const Ring& r, size_t ring_id) {
    size_t n = r.size();
    for (size_t i = 0; i < n; ++i) {
        const Point2D& a = r[i];
        const Point2D& b = r[(i + 1) % n];
        spans.push_back({std::min(a.x, b.x), std::max(a.x, b.x), ring_id, i});
    }
}

// Sort-and-sweep on x: calls visit(first, second) for every pair of edges
// whose x extents overlap within tolerance, stopping when visit returns true
template <typename Visit>
bool any_overlapping_pair(std::vector<EdgeSpan>& spans, double tolerance, Visit visit) {
    std::sort(spans.begin(), spans.end(), [](const EdgeSpan& a, const EdgeSpan& b) {
        return a.min_x < b.min_x;
    });
    for (size_t i = 0; i < spans.size(); ++i) {
        for (size_t j = i + 1; j < spans.size() && spans[j].min_x <= spans[i].max_x + tolerance; ++j) {
            if (visit(spans[i], spans[j])) {
                return true;
            }
        }
    }
    return false;
}

}  // namespace

namespace ring {

double signed_area(const Ring& r) {
    double sum = 0.0;
    size_t n = r.size();
    for (size_t i = 0; i < n; ++i) {
        sum += r[i].cross(r[(i + 1) % n]);
    }
    return 0.5 * sum;
}

double perimeter(const Ring& r) {
    double total = 0.0;
    size_t n = r.size();
    for (size_t i = 0; i < n; ++i) {
        total += r[i].distance_to(r[(i + 1) % n]);
    }
    return total;
}

Point2D centroid(const Ring& r) {
    if (r.empty()) {
        return {};
    }

    // Accumulate relative to the first vertex to limit cancellation
    const Point2D& ref = r.front();
    double area2 = 0.0;
    Vec2 acc;
    size_t n = r.size();
    for (size_t i = 0; i < n; ++i) {
        Vec2 a = r[i] - ref;
        Vec2 b = r[(i + 1) % n] - ref;
        double c = a.cross(b);
        area2 += c;
        acc += (a + b) * c;
    }

    if (std::abs(area2) < std::numeric_limits<double>::epsilon()) {
        Vec2 mean;
        for (const auto& p : r) {
            mean += p;
        }
        return mean / static_cast<double>(n);
    }
    return ref + acc / (3.0 * area2);
}

Ring remove_duplicates(const Ring& r, double tolerance) {
    Ring result;
    result.reserve(r.size());
    for (const auto& p : r) {
        if (result.empty() || !result.back().approx_equal(p, tolerance)) {
            result.push_back(p);
        }
    }
    while (result.size() > 1 && result.back().approx_equal(result.front(), tolerance)) {
        result.pop_back();
    }
    return result;
}

bool is_simple(const Ring& r, double tolerance) {
    size_t n = r.size();
    if (n < 3) {
        return false;
    }
    if (std::abs(signed_area(r)) <= tolerance * tolerance) {
        return false;
    }

    for (size_t i = 0; i < n; ++i) {
        // Adjacent edge folding back onto this one
        Vec2 e1 = r[(i + 1) % n] - r[i];
        Vec2 e2 = r[(i + 2) % n] - r[(i + 1) % n];
        if (std::abs(e1.cross(e2)) <= tolerance * std::max(e1.length(), e2.length()) &&
            e1.dot(e2) < 0.0) {
            return false;
        }
    }

    std::vector<EdgeSpan> spans;
    spans.reserve(n);
    append_spans(spans, r, 0);
    bool touching = any_overlapping_pair(spans, tolerance, [&](const EdgeSpan& e, const EdgeSpan& f) {
        size_t gap = e.index > f.index ? e.index - f.index : f.index - e.index;
        // Neighbours share a vertex, including the first and last edges
        if (gap == 1 || gap == n - 1) {
            return false;
        }
        return segments_touch(r[e.index], r[(e.index + 1) % n],
                              r[f.index], r[(f.index + 1) % n], tolerance);
    });
    return !touching;
}

bool contains(const Ring& r, const Point2D& p) {
    bool inside = false;
    size_t n = r.size();
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        const Point2D& a = r[i];
        const Point2D& b = r[j];
        if ((a.y > p.y) != (b.y > p.y)) {
            double x_cross = a.x + (p.y - a.y) * (b.x - a.x) / (b.y - a.y);
            if (p.x < x_cross) {
                inside = !inside;
            }
        }
    }
    return inside;
}

bool edges_touch(const Ring& a, const Ring& b, double tolerance) {
    std::vector<EdgeSpan> spans;
    spans.reserve(a.size() + b.size());
    append_spans(spans, a, 0);
    append_spans(spans, b, 1);
    return any_overlapping_pair(spans, tolerance, [&](const EdgeSpan& e, const EdgeSpan& f) {
        if (e.ring == f.ring) {
            return false;
        }
        const Ring& re = e.ring == 0 ? a : b;
        const Ring& rf = f.ring == 0 ? a : b;
        return segments_touch(re[e.index], re[(e.index + 1) % re.size()],
                              rf[f.index], rf[(f.index + 1) % rf.size()], tolerance);
    });
}

Ring reversed(const Ring& r) {
    return Ring(r.rbegin(), r.rend());
}

}  // namespace ring

ClosedPolygon::ClosedPolygon(Ring outer, std::vector<Ring> holes) {
    outer_ = ring::remove_duplicates(outer);
    if (outer_.size() < 3) {
        throw InvalidPolygonError("at least 3 points required");
    }
    if (!ring::is_simple(outer_)) {
        throw InvalidPolygonError("constructed polygon is not valid");
    }

    holes_.reserve(holes.size());
    for (const auto& hole : holes) {
        Ring h = ring::remove_duplicates(hole);
        if (h.size() < 3) {
            throw InvalidPolygonError("at least 3 points required");
        }
        if (!ring::is_simple(h)) {
            throw InvalidPolygonError("constructed polygon is not valid");
        }
        if (!ring::contains(outer_, h.front()) || ring::edges_touch(outer_, h)) {
            throw InvalidPolygonError("constructed polygon is not valid");
        }
        for (const auto& other : holes_) {
            if (ring::edges_touch(other, h) ||
                ring::contains(other, h.front()) || ring::contains(h, other.front())) {
                throw InvalidPolygonError("constructed polygon is not valid");
            }
        }
        holes_.push_back(std::move(h));
    }

    normalize_orientation();
}

ClosedPolygon::ClosedPolygon(Ring outer, std::vector<Ring> holes, Trusted)
    : outer_(std::move(outer)), holes_(std::move(holes)) {
    normalize_orientation();
}

void ClosedPolygon::normalize_orientation() {
    if (ring::signed_area(outer_) < 0.0) {
        std::reverse(outer_.begin(), outer_.end());
    }
    for (auto& h : holes_) {
        if (ring::signed_area(h) > 0.0) {
            std::reverse(h.begin(), h.end());
        }
    }
}

double ClosedPolygon::area() const {
    double total = ring::signed_area(outer_);
    for (const auto& h : holes_) {
        total += ring::signed_area(h);
    }
    return total;
}

double ClosedPolygon::perimeter() const {
    double total = ring::perimeter(outer_);
    for (const auto& h : holes_) {
        total += ring::perimeter(h);
    }
    return total;
}

Point2D ClosedPolygon::centroid() const {
    double outer_area = ring::signed_area(outer_);
    Vec2 moment = ring::centroid(outer_) * outer_area;
    double total = outer_area;
    for (const auto& h : holes_) {
        double a = ring::signed_area(h);
        moment += ring::centroid(h) * a;
        total += a;
    }
    if (total == 0.0) {
        return ring::centroid(outer_);
    }
    return moment / total;
}

Bounds ClosedPolygon::bounds() const {
    if (outer_.empty()) {
        return {};
    }
    Bounds b{outer_[0].x, outer_[0].y, outer_[0].x, outer_[0].y};
    // Holes lie inside the outer ring
    for (const auto& p : outer_) {
        b.min_x = std::min(b.min_x, p.x);
        b.min_y = std::min(b.min_y, p.y);
        b.max_x = std::max(b.max_x, p.x);
        b.max_y = std::max(b.max_y, p.y);
    }
    return b;
}

size_t ClosedPolygon::vertex_count() const {
    size_t count = outer_.size();
    for (const auto& h : holes_) {
        count += h.size();
    }
    return count;
}

bool ClosedPolygon::contains(const Point2D& p) const {
    if (!ring::contains(outer_, p)) {
        return false;
    }
    for (const auto& h : holes_) {
        if (ring::contains(h, p)) {
            return false;
        }
    }
    return true;
}

ClosedPolygon ClosedPolygon::translated(const Vec2& offset) const {
    auto move = [&](const Ring& r) {
        Ring out;
        out.reserve(r.size());
        for (const auto& p : r) {
            out.push_back(p + offset);
        }
        return out;
    };

    std::vector<Ring> holes;
    holes.reserve(holes_.size());
    for (const auto& h : holes_) {
        holes.push_back(move(h));
    }
    return ClosedPolygon(move(outer_), std::move(holes), Trusted{});
}

ClosedPolygon ClosedPolygon::rotated(double angle_deg, const Point2D& origin) const {
    if (angle_deg == 0.0) {
        return *this;
    }

    auto turn = [&](const Ring& r) {
        Ring out;
        out.reserve(r.size());
        for (const auto& p : r) {
            out.push_back(p.rotated_about(origin, angle_deg));
        }
        return out;
    };

    std::vector<Ring> holes;
    holes.reserve(holes_.size());
    for (const auto& h : holes_) {
        holes.push_back(turn(h));
    }
    return ClosedPolygon(turn(outer_), std::move(holes), Trusted{});
}

ClosedPolygon ClosedPolygon::mirrored(bool flip_x, bool flip_y, const Point2D& origin) const {
    auto flip = [&](const Ring& r) {
        Ring out;
        out.reserve(r.size());
        for (const auto& p : r) {
            Vec2 d = p - origin;
            if (flip_x) d.x = -d.x;
            if (flip_y) d.y = -d.y;
            out.push_back(origin + d);
        }
        return out;
    };

    std::vector<Ring> holes;
    holes.reserve(holes_.size());
    for (const auto& h : holes_) {
        holes.push_back(flip(h));
    }
    return ClosedPolygon(flip(outer_), std::move(holes), Trusted{});
}

}  // namespace sectionpath
