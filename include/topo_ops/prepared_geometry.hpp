#ifndef TOPO_OPS_PREPARED_GEOMETRY_HPP
#define TOPO_OPS_PREPARED_GEOMETRY_HPP

#include <memory>
#include <utility>

#include "base.hpp"
#include "kernel.hpp"
#include "geometry.hpp"
#include "intersection_matrix.hpp"
#include "geometry_graph.hpp"
#include "relate.hpp"


namespace topo_ops {

/** A geometry with its self-noded graph computed in advance.

Relating the same geometry to many others this way only finds the
self-intersections of the geometry once. The geometry is owned by this object
and stays at the same address when the object is moved. */
template<coordinate T,typename Kernel=robust_kernel,typename EdgeSetIntersector=sweep_edge_set_intersector>
class prepared_geometry {
    std::unique_ptr<const geometry<T>> _geometry;
    geometry_graph<T,Kernel> _graph;

public:
    explicit prepared_geometry(geometry<T> g)
        : _geometry{std::make_unique<const geometry<T>>(std::move(g))}, _graph{0,*_geometry}
    {
        _graph.template compute_self_nodes<EdgeSetIntersector>();
    }

    const geometry<T> &parent_geometry() const noexcept { return *_geometry; }

    /** Compute the intersection matrix of this geometry and "other" */
    template<geometry_type G> requires std::same_as<geometry_coord_t<G>,T>
    intersection_matrix relate(const G &other) const {
        const auto &go = detail::as_geometry(other);
        relate_operation<T,Kernel,EdgeSetIntersector> op(
            _graph.clone_for_arg_index(0),
            geometry_graph<T,Kernel>(1,go));
        return op.compute_intersection_matrix();
    }

    /** Compute the intersection matrix of this geometry and "other", reusing
    the graphs of both */
    intersection_matrix relate(const prepared_geometry &other) const {
        relate_operation<T,Kernel,EdgeSetIntersector> op(
            _graph.clone_for_arg_index(0),
            other._graph.clone_for_arg_index(1));
        return op.compute_intersection_matrix();
    }
};

} // namespace topo_ops

#endif
