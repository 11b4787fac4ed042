#ifndef TOPO_OPS_EDGE_END_BUILDER_HPP
#define TOPO_OPS_EDGE_END_BUILDER_HPP

#include <vector>
#include <span>
#include <cstddef>

#include "base.hpp"
#include "position.hpp"
#include "edge.hpp"
#include "edge_end.hpp"


namespace topo_ops {

/** Splits edges into edge ends at their intersection points.

Each intersection gets up to two edge ends: one pointing back along the edge
and one pointing forward. An edge end points toward the nearest of the adjacent
intersection and the adjacent vertex. */
template<coordinate T> class edge_end_builder {
    std::size_t geom_index;

    void create_edge_end_for_prev(
        const edge<T> &e,
        std::size_t edge_index,
        std::vector<edge_end<T>> &out,
        const edge_intersection<T> &curr,
        const edge_intersection<T> *prev) const
    {
        std::size_t i_prev = curr.segment_index;
        if(curr.distance == 0) {
            // the first point of the edge has nothing before it
            if(i_prev == 0) return;
            --i_prev;
        }

        point_t<T> coord_prev = e.coords()[i_prev];
        if(prev && prev->segment_index >= i_prev) coord_prev = prev->coord;

        topo_ops::label lbl = e.label();
        lbl.flip();
        out.emplace_back(edge_end_key<T>{curr.coord,coord_prev},lbl,geom_index,edge_index);
    }

    void create_edge_end_for_next(
        const edge<T> &e,
        std::size_t edge_index,
        std::vector<edge_end<T>> &out,
        const edge_intersection<T> &curr,
        const edge_intersection<T> *next) const
    {
        std::size_t i_next = curr.segment_index + 1;
        if(i_next >= e.coords().size()) {
            TOPO_OPS_ASSERT(!next);
            return;
        }

        point_t<T> coord_next = e.coords()[i_next];
        if(next && next->segment_index == curr.segment_index) coord_next = next->coord;

        out.emplace_back(edge_end_key<T>{curr.coord,coord_next},e.label(),geom_index,edge_index);
    }

    void compute_ends_for_edge(edge<T> &e,std::size_t edge_index,std::vector<edge_end<T>> &out) const {
        e.add_edge_intersection_list_endpoints();

        const edge_intersection<T> *prev = nullptr;
        for(auto itr = e.intersections().begin(); itr != e.intersections().end(); ++itr) {
            auto next_itr = std::next(itr);
            const edge_intersection<T> *next = next_itr == e.intersections().end() ? nullptr : &*next_itr;

            create_edge_end_for_prev(e,edge_index,out,*itr,prev);
            create_edge_end_for_next(e,edge_index,out,*itr,next);
            prev = &*itr;
        }
    }

public:
    explicit edge_end_builder(std::size_t geom_index) : geom_index{geom_index} {}

    /** Compute the edge ends of every edge. This also seeds each edge's
    intersection list with its end points, so no intersections may be added to
    the edges afterwards. */
    std::vector<edge_end<T>> compute_ends_for_edges(std::span<edge<T>> edges) const {
        std::vector<edge_end<T>> r;
        for(std::size_t i=0; i<edges.size(); ++i) compute_ends_for_edge(edges[i],i,r);
        return r;
    }
};

} // namespace topo_ops

#endif
