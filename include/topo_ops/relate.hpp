#ifndef TOPO_OPS_RELATE_HPP
#define TOPO_OPS_RELATE_HPP

#include <vector>
#include <utility>
#include <cstddef>
#include <concepts>

#include "base.hpp"
#include "kernel.hpp"
#include "position.hpp"
#include "geometry.hpp"
#include "intersection_matrix.hpp"
#include "edge.hpp"
#include "node_map.hpp"
#include "segment_intersector.hpp"
#include "geometry_graph.hpp"
#include "edge_end.hpp"
#include "edge_end_builder.hpp"
#include "edge_end_bundle.hpp"


namespace topo_ops {

/** Computes the intersection matrix of two geometry graphs.

The graphs are consumed by the operation. "compute_intersection_matrix" may only
be called once. */
template<coordinate T,typename Kernel=robust_kernel,typename EdgeSetIntersector=sweep_edge_set_intersector>
class relate_operation {
    struct relate_node {
        coord_node<T> node;
        edge_end_bundle_star<T,Kernel> star;

        explicit relate_node(const point_t<T> &p) : node{p} {}
    };

    geometry_graph<T,Kernel> graph_a;
    geometry_graph<T,Kernel> graph_b;
    node_map<T,relate_node> nodes;

    /* pairs of geometry index and edge index */
    std::vector<std::pair<std::size_t,std::size_t>> isolated_edges;

    bool computed = false;

    geometry_graph<T,Kernel> &graph(std::size_t geom_index) {
        return geom_index == 0 ? graph_a : graph_b;
    }

    /* Every intersection point of an edge becomes a node. An intersection on
    the boundary of an area counts as one more boundary at that node. */
    void compute_intersection_nodes(std::size_t geom_index) {
        for(auto &e : graph(geom_index).edges()) {
            bool on_boundary = e.label().on_position(geom_index) == coord_pos::on_boundary;
            for(auto &ei : e.intersections()) {
                coord_node<T> &n = nodes.insert_node_with_coordinate(ei.coord).node;
                if(on_boundary) n.set_label_boundary(geom_index);
                else if(n.label().is_empty(geom_index)) n.set_label_on_position(geom_index,coord_pos::inside);
            }
        }
    }

    /* The labels of the nodes of the original graphs take priority over labels
    derived from intersections */
    void copy_nodes_and_labels(std::size_t geom_index) {
        for(auto &[p,gn] : graph(geom_index).nodes()) {
            auto pos = gn.label().on_position(geom_index);
            TOPO_OPS_ASSERT(pos);
            if(pos) nodes.insert_node_with_coordinate(p).node.set_label_on_position(geom_index,*pos);
        }
    }

    /* A node that only one geometry has, is located relative to the other
    geometry directly */
    void label_isolated_nodes() {
        for(auto &[p,n] : nodes) {
            TOPO_OPS_ASSERT(n.node.label().geometry_count() > 0);
            if(n.node.is_isolated()) {
                std::size_t target = n.node.label().is_empty(0) ? 0 : 1;
                n.node.label().set_all_positions(
                    target,
                    coordinate_position<Kernel>(graph(target).parent_geometry(),p));
            }
        }
    }

    /* A proper intersection gives a lower bound for several cells without
    having to look at the nodes */
    void compute_proper_intersection_im(const segment_intersector<T,Kernel> &si,intersection_matrix &im) {
        dimensions dim_a = graph_a.parent_dimensions();
        dimensions dim_b = graph_b.parent_dimensions();
        bool has_proper = si.has_proper_intersection();
        bool has_proper_interior = si.has_proper_interior_intersection();

        if(dim_a == dimensions::area && dim_b == dimensions::area) {
            if(has_proper) im.set_at_least_from_string("212101212");
        } else if(dim_a == dimensions::area && dim_b == dimensions::line) {
            if(has_proper) im.set_at_least_from_string("FFF0FFFF2");
            if(has_proper_interior) im.set_at_least_from_string("1FFFFF1FF");
        } else if(dim_a == dimensions::line && dim_b == dimensions::area) {
            if(has_proper) im.set_at_least_from_string("F0FFFFFF2");
            if(has_proper_interior) im.set_at_least_from_string("1F1FFFFFF");
        } else if(dim_a == dimensions::line && dim_b == dimensions::line) {
            if(has_proper_interior) im.set_at_least_from_string("0FFFFFFFF");
        }
    }

    void insert_edge_ends(std::vector<edge_end<T>> ends) {
        for(auto &e : ends) {
            point_t<T> p = e.coordinate();
            nodes.insert_node_with_coordinate(p).star.insert(std::move(e));
        }
    }

    /* An edge that doesn't touch the other geometry lies entirely in the
    interior or the exterior of it, so one point of it is enough to locate it */
    void label_isolated_edges(std::size_t this_index,std::size_t target_index) {
        const geometry_graph<T,Kernel> &target = graph(target_index);
        auto edges = graph(this_index).edges();
        for(std::size_t i=0; i<edges.size(); ++i) {
            if(!edges[i].is_isolated()) continue;

            coord_pos pos = coord_pos::outside;
            if(target.parent_dimensions() > dimensions::point) {
                pos = coordinate_position<Kernel>(target.parent_geometry(),edges[i].coords()[0]);
            }
            edges[i].label().set_all_positions(target_index,pos);
            isolated_edges.emplace_back(this_index,i);
        }
    }

public:
    relate_operation(geometry_graph<T,Kernel> a,geometry_graph<T,Kernel> b)
        : graph_a(std::move(a)), graph_b(std::move(b))
    {
        TOPO_OPS_ASSERT(graph_a.arg_index() == 0 && graph_b.arg_index() == 1);
    }

    intersection_matrix compute_intersection_matrix() {
        TOPO_OPS_ASSERT(!computed);
        computed = true;

        intersection_matrix im = intersection_matrix::empty_disjoint();

        auto bounds_a = bounding_rect(graph_a.parent_geometry());
        auto bounds_b = bounding_rect(graph_b.parent_geometry());
        if(!bounds_a || !bounds_b || !bounds_a->intersects(*bounds_b)) {
            im.compute_disjoint(graph_a.parent_geometry(),graph_b.parent_geometry());
            return im;
        }

        graph_a.template compute_self_nodes<EdgeSetIntersector>();
        graph_b.template compute_self_nodes<EdgeSetIntersector>();

        auto si = graph_a.template compute_edge_intersections<EdgeSetIntersector>(graph_b);

        compute_intersection_nodes(0);
        compute_intersection_nodes(1);
        copy_nodes_and_labels(0);
        copy_nodes_and_labels(1);
        label_isolated_nodes();

        compute_proper_intersection_im(si,im);

        /* no intersections may be added to the edges after this point */
        insert_edge_ends(edge_end_builder<T>(0).compute_ends_for_edges(graph_a.edges()));
        insert_edge_ends(edge_end_builder<T>(1).compute_ends_for_edges(graph_b.edges()));

        std::vector<std::pair<const coord_node<T>*,labeled_edge_end_bundle_star<T>>> labeled;
        labeled.reserve(nodes.size());
        for(auto &[p,n] : nodes) labeled.emplace_back(&n.node,n.star.into_labeled(graph_a,graph_b));

        label_isolated_edges(0,1);
        label_isolated_edges(1,0);

        TOPO_OPS_DEBUG_LOG("matrix before the nodes and edges: {}",im.str());

        for(auto [gi,ei] : isolated_edges) {
            topo_ops::update_intersection_matrix(graph(gi).edges()[ei].label(),im);
        }
        for(auto &[node,star] : labeled) {
            node->update_intersection_matrix(im);
            star.update_intersection_matrix(im);
        }

        return im;
    }
};

namespace detail {
template<coordinate T> const geometry<T> &as_geometry(const geometry<T> &g) { return g; }
template<geometry_type G> geometry<geometry_coord_t<G>> as_geometry(const G &g) { return g; }
} // namespace detail

/** Compute the DE-9IM intersection matrix of "a" and "b".

Both geometries must have the same coordinate type. "Kernel" supplies the
orientation predicate used for every geometric decision. */
template<typename Kernel=robust_kernel,geometry_type A,geometry_type B>
requires std::same_as<geometry_coord_t<A>,geometry_coord_t<B>>
intersection_matrix relate(const A &a,const B &b) {
    using T = geometry_coord_t<A>;

    const auto &ga = detail::as_geometry(a);
    const auto &gb = detail::as_geometry(b);
    relate_operation<T,Kernel> op(geometry_graph<T,Kernel>(0,ga),geometry_graph<T,Kernel>(1,gb));
    return op.compute_intersection_matrix();
}

} // namespace topo_ops

#endif
