#ifndef TOPO_OPS_LINE_INTERSECTOR_HPP
#define TOPO_OPS_LINE_INTERSECTOR_HPP

#include <optional>
#include <algorithm>
#include <ostream>

#include "base.hpp"
#include "kernel.hpp"
#include "geometry.hpp"


namespace topo_ops {

enum class intersection_kind {single_point,collinear};

/** The intersection of two line segments.

For a single point, "start" and "end" are the same. A proper intersection is a
single point that lies in the interior of both segments. A collinear
intersection is never proper. */
template<coordinate T> struct line_intersection {
    intersection_kind kind;
    point_t<T> start;
    point_t<T> end;
    bool is_proper;

    static line_intersection single_point(const point_t<T> &p,bool is_proper) {
        return {intersection_kind::single_point,p,p,is_proper};
    }

    static line_intersection collinear(const point_t<T> &a,const point_t<T> &b) {
        return {intersection_kind::collinear,a,b,false};
    }

    static line_intersection collinear(const line<T> &l) {
        return collinear(l.start,l.end);
    }

    bool is_collinear() const { return kind == intersection_kind::collinear; }

    friend bool operator==(const line_intersection &a,const line_intersection &b) {
        return a.kind == b.kind && a.start == b.start && a.end == b.end && a.is_proper == b.is_proper;
    }

    friend std::ostream &operator<<(std::ostream &os,const line_intersection &x) {
        if(x.is_collinear()) {
            return os << "collinear{(" << x.start.x() << ',' << x.start.y() << ") - ("
                << x.end.x() << ',' << x.end.y() << ")}";
        }
        return os << (x.is_proper ? "proper" : "improper") << "{(" << x.start.x() << ',' << x.start.y() << ")}";
    }
};

namespace detail {
template<coordinate T> T point_segment_distance(const point_t<T> &p,const line<T> &l) {
    if(l.start == l.end) return vmag(p - l.start);

    point_t<T> d = l.delta();
    T r = vdot(p - l.start,d) / square(d);
    if(r <= 0) return vmag(p - l.start);
    if(r >= 1) return vmag(p - l.end);

    T s = ((l.start.y() - p.y()) * d.x() - (l.start.x() - p.x()) * d.y()) / square(d);
    return coord_ops<T>::abs(s) * vmag(d);
}

/* Of the four end points, the one closest to the other segment */
template<coordinate T> point_t<T> nearest_endpoint(const line<T> &p,const line<T> &q) {
    point_t<T> nearest = p.start;
    T min_dist = point_segment_distance(p.start,q);

    T dist = point_segment_distance(p.end,q);
    if(dist < min_dist) {
        min_dist = dist;
        nearest = p.end;
    }
    dist = point_segment_distance(q.start,p);
    if(dist < min_dist) {
        min_dist = dist;
        nearest = q.start;
    }
    dist = point_segment_distance(q.end,p);
    if(dist < min_dist) nearest = q.end;

    return nearest;
}

/* Intersection of the infinite lines through "p" and "q", using homogeneous
coordinates. The points are translated so that the middle of the overlap of the
bounding boxes is at the origin, to reduce the loss of precision. */
template<coordinate T> std::optional<point_t<T>> raw_line_intersection(const line<T> &p,const line<T> &q) {
    T int_min_x = std::max(std::min(p.start.x(),p.end.x()),std::min(q.start.x(),q.end.x()));
    T int_max_x = std::min(std::max(p.start.x(),p.end.x()),std::max(q.start.x(),q.end.x()));
    T int_min_y = std::max(std::min(p.start.y(),p.end.y()),std::min(q.start.y(),q.end.y()));
    T int_max_y = std::min(std::max(p.start.y(),p.end.y()),std::max(q.start.y(),q.end.y()));

    point_t<T> mid{(int_min_x + int_max_x) / 2,(int_min_y + int_max_y) / 2};

    point_t<T> p1 = p.start - mid;
    point_t<T> p2 = p.end - mid;
    point_t<T> q1 = q.start - mid;
    point_t<T> q2 = q.end - mid;

    T px = p1.y() - p2.y();
    T py = p2.x() - p1.x();
    T pw = p1.x() * p2.y() - p2.x() * p1.y();

    T qx = q1.y() - q2.y();
    T qy = q2.x() - q1.x();
    T qw = q1.x() * q2.y() - q2.x() * q1.y();

    T xw = py * qw - qy * pw;
    T yw = qx * pw - px * qw;
    T w = px * qy - qx * py;

    T x_int = xw / w;
    T y_int = yw / w;
    if(!coord_ops<T>::is_finite(x_int) || !coord_ops<T>::is_finite(y_int)) return std::nullopt;

    return point_t<T>{x_int + mid.x(),y_int + mid.y()};
}

template<coordinate T> point_t<T> proper_intersection(const line<T> &p,const line<T> &q) {
    auto r = raw_line_intersection(p,q);
    point_t<T> int_pt = r ? *r : nearest_endpoint(p,q);

    /* the computed point can land outside of either segment due to rounding */
    if(!(rect<T>{p.start,p.end}.intersects(int_pt) && rect<T>{q.start,q.end}.intersects(int_pt))) {
        int_pt = nearest_endpoint(p,q);
    }
    return int_pt;
}

template<coordinate T> std::optional<line_intersection<T>> collinear_intersection(const line<T> &p,const line<T> &q) {
    using li = line_intersection<T>;

    rect<T> p_bounds{p.start,p.end};
    rect<T> q_bounds{q.start,q.end};
    bool q_start_in_p = p_bounds.intersects(q.start);
    bool q_end_in_p = p_bounds.intersects(q.end);
    bool p_start_in_q = q_bounds.intersects(p.start);
    bool p_end_in_q = q_bounds.intersects(p.end);

    if(q_start_in_p && q_end_in_p) return li::collinear(q);
    if(p_start_in_q && p_end_in_q) return li::collinear(p);

    if(q_start_in_p && p_start_in_q) {
        if(!q_end_in_p && !p_end_in_q && q.start == p.start) return li::single_point(q.start,false);
        return li::collinear(q.start,p.start);
    }
    if(q_start_in_p && p_end_in_q) {
        if(!q_end_in_p && !p_start_in_q && q.start == p.end) return li::single_point(q.start,false);
        return li::collinear(q.start,p.end);
    }
    if(q_end_in_p && p_start_in_q) {
        if(!q_start_in_p && !p_end_in_q && q.end == p.start) return li::single_point(q.end,false);
        return li::collinear(q.end,p.start);
    }
    if(q_end_in_p && p_end_in_q) {
        if(!q_start_in_p && !p_start_in_q && q.end == p.end) return li::single_point(q.end,false);
        return li::collinear(q.end,p.end);
    }
    return std::nullopt;
}
} // namespace detail

/** Compute the intersection of two line segments.

Returns nothing if the segments don't intersect. All orientation tests go
through "Kernel". */
template<typename Kernel=robust_kernel,coordinate T>
std::optional<line_intersection<T>> intersect_segments(const line<T> &p,const line<T> &q) {
    if(!rect<T>{p.start,p.end}.intersects(rect<T>{q.start,q.end})) return std::nullopt;

    orientation p_q1 = Kernel::orient2d(p.start,p.end,q.start);
    orientation p_q2 = Kernel::orient2d(p.start,p.end,q.end);
    if(p_q1 == p_q2 && p_q1 != orientation::collinear) return std::nullopt;

    orientation q_p1 = Kernel::orient2d(q.start,q.end,p.start);
    orientation q_p2 = Kernel::orient2d(q.start,q.end,p.end);
    if(q_p1 == q_p2 && q_p1 != orientation::collinear) return std::nullopt;

    if(p_q1 == orientation::collinear && p_q2 == orientation::collinear
        && q_p1 == orientation::collinear && q_p2 == orientation::collinear)
    {
        return detail::collinear_intersection(p,q);
    }

    /* At this point, if any orientation is collinear, the segments meet at an
    end point. Checking for equal end points first means the exact value is
    used regardless of the orientation tests. */
    if(p_q1 == orientation::collinear || p_q2 == orientation::collinear
        || q_p1 == orientation::collinear || q_p2 == orientation::collinear)
    {
        point_t<T> intr;
        if(p.start == q.start || p.start == q.end) intr = p.start;
        else if(p.end == q.start || p.end == q.end) intr = p.end;
        else if(p_q1 == orientation::collinear) intr = q.start;
        else if(p_q2 == orientation::collinear) intr = q.end;
        else if(q_p1 == orientation::collinear) intr = p.start;
        else {
            TOPO_OPS_ASSERT(q_p2 == orientation::collinear);
            intr = p.end;
        }
        return line_intersection<T>::single_point(intr,false);
    }

    return line_intersection<T>::single_point(detail::proper_intersection(p,q),true);
}

/** Measure the position of "intersection" along "l".

This is not the Euclidean distance. It is the distance along whichever axis "l"
spans more of, which is enough to order points on the same segment, and is
exact for points that are on the segment. The result is zero only if
"intersection" equals the start of "l". */
template<coordinate T> T compute_edge_distance(const point_t<T> &intersection,const line<T> &l) {
    T dx = coord_ops<T>::abs(l.end.x() - l.start.x());
    T dy = coord_ops<T>::abs(l.end.y() - l.start.y());

    T dist;
    if(intersection == l.start) {
        dist = 0;
    } else if(intersection == l.end) {
        dist = std::max(dx,dy);
    } else {
        T intersection_dx = coord_ops<T>::abs(intersection.x() - l.start.x());
        T intersection_dy = coord_ops<T>::abs(intersection.y() - l.start.y());
        dist = dx > dy ? intersection_dx : intersection_dy;

        /* non-endpoints must have a non-zero distance */
        if(dist == 0) dist = std::max(intersection_dx,intersection_dy);
    }
    TOPO_OPS_ASSERT(!(dist == 0 && intersection != l.start));
    return dist;
}

} // namespace topo_ops

#endif
