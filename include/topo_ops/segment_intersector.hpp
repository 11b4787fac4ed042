#ifndef TOPO_OPS_SEGMENT_INTERSECTOR_HPP
#define TOPO_OPS_SEGMENT_INTERSECTOR_HPP

#include <vector>
#include <array>
#include <span>
#include <algorithm>
#include <optional>
#include <cstddef>

#include "base.hpp"
#include "kernel.hpp"
#include "geometry.hpp"
#include "line_intersector.hpp"
#include "edge.hpp"


namespace topo_ops {

/** Computes the intersections between pairs of segments and records them on
the edges that the segments belong to.

When both edges come from the same geometry, the intersections are "self
nodes" and every intersection point is recorded. When the edges come from
different geometries, proper intersections are not recorded on the edges. They
only set "proper_intersection_point" and "has_proper_interior", which is enough
for the relate operation to fill in the matrix directly. */
template<coordinate T,typename Kernel=robust_kernel> class segment_intersector {
    bool _edges_are_from_same_geometry;
    bool _has_intersection = false;
    bool _has_proper_interior = false;
    std::optional<point_t<T>> _proper_intersection_point;
    std::array<std::vector<point_t<T>>,2> _boundary_nodes;

    static bool is_adjacent_segments(std::size_t i1,std::size_t i2) {
        return (i1 > i2 ? i1 - i2 : i2 - i1) == 1;
    }

    /* An intersection between consecutive segments of the same edge, at their
    shared vertex, is not interesting */
    bool is_trivial_intersection(
        const edge<T> &e0,
        std::size_t seg0,
        const edge<T> &e1,
        std::size_t seg1,
        const line_intersection<T> &intr) const
    {
        if(&e0 != &e1 || intr.is_collinear()) return false;
        if(is_adjacent_segments(seg0,seg1)) return true;
        if(e0.is_closed()) {
            std::size_t last = e0.segment_count() - 1;
            if((seg0 == 0 && seg1 == last) || (seg1 == 0 && seg0 == last)) return true;
        }
        return false;
    }

    bool is_boundary_point(const point_t<T> &p) const {
        for(auto &nodes : _boundary_nodes) {
            if(std::ranges::find(nodes,p) != nodes.end()) return true;
        }
        return false;
    }

public:
    explicit segment_intersector(bool edges_are_from_same_geometry)
        : _edges_are_from_same_geometry(edges_are_from_same_geometry) {}

    void set_boundary_nodes(std::vector<point_t<T>> nodes0,std::vector<point_t<T>> nodes1) {
        _boundary_nodes[0] = std::move(nodes0);
        _boundary_nodes[1] = std::move(nodes1);
    }

    bool edges_are_from_same_geometry() const noexcept { return _edges_are_from_same_geometry; }
    bool has_intersection() const noexcept { return _has_intersection; }
    bool has_proper_intersection() const noexcept { return _proper_intersection_point.has_value(); }

    /** True if a proper intersection was found at a point that is not a
    boundary node of either geometry */
    bool has_proper_interior_intersection() const noexcept { return _has_proper_interior; }

    const std::optional<point_t<T>> &proper_intersection_point() const noexcept {
        return _proper_intersection_point;
    }

    /** Intersect segment "seg0" of "e0" with segment "seg1" of "e1". "e0" and
    "e1" may be the same edge. */
    void add_intersections(edge<T> &e0,std::size_t seg0,edge<T> &e1,std::size_t seg1) {
        if(&e0 == &e1 && seg0 == seg1) return;

        auto intr = intersect_segments<Kernel>(e0.segment(seg0),e1.segment(seg1));
        if(!intr) return;

        if(!_edges_are_from_same_geometry) {
            e0.mark_as_unisolated();
            e1.mark_as_unisolated();
        }

        if(is_trivial_intersection(e0,seg0,e1,seg1,*intr)) return;

        _has_intersection = true;
        if(_edges_are_from_same_geometry || !intr->is_proper) {
            e0.add_intersections(*intr,seg0);
            e1.add_intersections(*intr,seg1);
        }
        if(intr->is_proper) {
            _proper_intersection_point = intr->start;
            if(!is_boundary_point(intr->start)) _has_proper_interior = true;
        }
    }
};

/** Tests every segment against every other segment */
struct simple_edge_set_intersector {
    template<coordinate T,typename Kernel>
    static void compute_intersections_within_set(
        std::span<edge<T>> edges,
        bool check_for_self_intersecting_edges,
        segment_intersector<T,Kernel> &si)
    {
        for(std::size_t i=0; i<edges.size(); ++i) {
            for(std::size_t j=i; j<edges.size(); ++j) {
                if(i == j && !check_for_self_intersecting_edges) continue;
                compute_intersects(edges[i],edges[j],si);
            }
        }
    }

    template<coordinate T,typename Kernel>
    static void compute_intersections_between_sets(
        std::span<edge<T>> edges0,
        std::span<edge<T>> edges1,
        segment_intersector<T,Kernel> &si)
    {
        for(auto &e0 : edges0) {
            for(auto &e1 : edges1) compute_intersects(e0,e1,si);
        }
    }

private:
    template<coordinate T,typename Kernel>
    static void compute_intersects(edge<T> &e0,edge<T> &e1,segment_intersector<T,Kernel> &si) {
        for(std::size_t i0=0; i0<e0.segment_count(); ++i0) {
            /* when both are the same edge, each pair only needs testing once */
            std::size_t i1 = &e0 == &e1 ? i0 + 1 : 0;
            for(; i1<e1.segment_count(); ++i1) si.add_intersections(e0,i0,e1,i1);
        }
    }
};

namespace detail {
enum class sweep_event_type {forward,backward};

template<coordinate T> struct sweep_segment {
    std::size_t set_index;
    std::size_t edge_index;
    std::size_t segment_index;
    rect<T> bounds;
};

template<typename T> struct sweep_event {
    T x;
    sweep_event_type type;
    std::size_t segment;
};

/* Ordered by x. At the same x, segments are added before any are removed, so
that segments that only touch at one x value are still compared. */
struct sweep_event_cmp {
    template<typename T> bool operator()(const sweep_event<T> &a,const sweep_event<T> &b) const {
        if(a.x != b.x) return a.x < b.x;
        return a.type < b.type;
    }
};
} // namespace detail

/** Finds candidate pairs of segments with a sweep over the X axis.

Each segment is added to the sweep when the sweep reaches the left side of its
bounding box and removed when the sweep passes the right side. Only the pairs
that are in the sweep at the same time, and whose bounding boxes overlap in Y,
are tested for intersection. */
class sweep_edge_set_intersector {
    template<coordinate T,typename Kernel,std::size_t N>
    static void run(
        const std::array<std::span<edge<T>>,N> &sets,
        bool within_set,
        bool check_for_self_intersecting_edges,
        segment_intersector<T,Kernel> &si)
    {
        using namespace detail;

        std::vector<sweep_segment<T>> segments;
        for(std::size_t s=0; s<N; ++s) {
            for(std::size_t e=0; e<sets[s].size(); ++e) {
                const edge<T> &ed = sets[s][e];
                for(std::size_t i=0; i<ed.segment_count(); ++i) {
                    line<T> l = ed.segment(i);
                    segments.push_back({s,e,i,rect<T>{l.start,l.end}});
                }
            }
        }

        std::vector<sweep_event<T>> events;
        events.reserve(segments.size() * 2);
        for(std::size_t i=0; i<segments.size(); ++i) {
            events.push_back({segments[i].bounds.min().x(),sweep_event_type::forward,i});
            events.push_back({segments[i].bounds.max().x(),sweep_event_type::backward,i});
        }
        std::ranges::sort(events,sweep_event_cmp{});

        std::vector<std::size_t> active;
        for(auto &ev : events) {
            if(ev.type == sweep_event_type::backward) {
                auto itr = std::ranges::find(active,ev.segment);
                TOPO_OPS_ASSERT(itr != active.end());
                *itr = active.back();
                active.pop_back();
                continue;
            }

            const sweep_segment<T> &a = segments[ev.segment];
            for(std::size_t other : active) {
                const sweep_segment<T> &b = segments[other];
                if(within_set) {
                    if(a.edge_index == b.edge_index && !check_for_self_intersecting_edges) continue;
                } else if(a.set_index == b.set_index) {
                    continue;
                }
                if(a.bounds.max().y() < b.bounds.min().y() || b.bounds.max().y() < a.bounds.min().y()) continue;

                /* keep the argument order stable so that the first edge is
                always from the first set */
                const sweep_segment<T> &first = a.set_index <= b.set_index ? a : b;
                const sweep_segment<T> &second = a.set_index <= b.set_index ? b : a;
                si.add_intersections(
                    sets[first.set_index][first.edge_index],
                    first.segment_index,
                    sets[second.set_index][second.edge_index],
                    second.segment_index);
            }
            active.push_back(ev.segment);
        }
    }

public:
    template<coordinate T,typename Kernel>
    static void compute_intersections_within_set(
        std::span<edge<T>> edges,
        bool check_for_self_intersecting_edges,
        segment_intersector<T,Kernel> &si)
    {
        run<T,Kernel,1>({edges},true,check_for_self_intersecting_edges,si);
    }

    template<coordinate T,typename Kernel>
    static void compute_intersections_between_sets(
        std::span<edge<T>> edges0,
        std::span<edge<T>> edges1,
        segment_intersector<T,Kernel> &si)
    {
        run<T,Kernel,2>({edges0,edges1},false,false,si);
    }
};

} // namespace topo_ops

#endif
