#ifndef TOPO_OPS_EDGE_END_BUNDLE_HPP
#define TOPO_OPS_EDGE_END_BUNDLE_HPP

#include <vector>
#include <map>
#include <array>
#include <optional>
#include <utility>
#include <cstddef>
#include <ostream>

#include "base.hpp"
#include "position.hpp"
#include "geometry.hpp"
#include "intersection_matrix.hpp"
#include "edge.hpp"
#include "edge_end.hpp"
#include "geometry_graph.hpp"


namespace topo_ops {

/** All the edge ends that leave the same node in the same direction */
template<coordinate T> class edge_end_bundle {
    point_t<T> _coordinate;
    std::vector<edge_end<T>> _edge_ends;

    /* An interior stub makes the bundle interior. Otherwise the "mod-2" rule
    applies to the stubs on the boundary. */
    void compute_label_on(topo_ops::label &lbl,std::size_t geom_index) const {
        std::size_t boundary_count = 0;
        bool found_interior = false;
        for(auto &e : _edge_ends) {
            auto pos = e.label().on_position(geom_index);
            if(pos == coord_pos::on_boundary) ++boundary_count;
            else if(pos == coord_pos::inside) found_interior = true;
        }

        if(found_interior) lbl.set_on_position(geom_index,coord_pos::inside);
        else if(boundary_count > 0) lbl.set_on_position(geom_index,determine_boundary(boundary_count));
    }

    /* Inside on a side of any stub takes priority over outside */
    void compute_label_side(topo_ops::label &lbl,std::size_t geom_index,direction side) const {
        std::optional<coord_pos> r;
        for(auto &e : _edge_ends) {
            if(!e.label().is_area()) continue;

            auto pos = e.label().position(geom_index,side);
            if(pos == coord_pos::inside) {
                r = coord_pos::inside;
                break;
            }
            if(pos == coord_pos::outside) r = coord_pos::outside;
        }
        if(r) lbl.set_position(geom_index,side,*r);
    }

public:
    explicit edge_end_bundle(const point_t<T> &coordinate) : _coordinate{coordinate} {}

    const point_t<T> &coordinate() const noexcept { return _coordinate; }
    const std::vector<edge_end<T>> &edge_ends() const noexcept { return _edge_ends; }

    void insert(edge_end<T> e) {
        TOPO_OPS_ASSERT(e.coordinate() == _coordinate);
        _edge_ends.push_back(std::move(e));
    }

    /** The combined label of the edge ends. The label has an area shape if any
    of the edge ends bounds an area. */
    topo_ops::label compute_label() const {
        bool is_area = false;
        for(auto &e : _edge_ends) is_area = is_area || e.label().is_area();

        topo_ops::label r = is_area ? topo_ops::label::empty_area() : topo_ops::label::empty_line_or_point();
        for(std::size_t i=0; i<2; ++i) {
            compute_label_on(r,i);
            if(is_area) {
                compute_label_side(r,i,direction::left);
                compute_label_side(r,i,direction::right);
            }
        }
        return r;
    }
};

/** An edge-end bundle along with its combined label */
template<coordinate T> class labeled_edge_end_bundle {
    topo_ops::label _label;
    edge_end_bundle<T> _bundle;

public:
    explicit labeled_edge_end_bundle(edge_end_bundle<T> bundle)
        : _label{bundle.compute_label()}, _bundle{std::move(bundle)} {}

    const topo_ops::label &label() const noexcept { return _label; }
    topo_ops::label &label() noexcept { return _label; }

    const point_t<T> &coordinate() const noexcept { return _bundle.coordinate(); }
    const edge_end_bundle<T> &bundle() const noexcept { return _bundle; }

    void update_intersection_matrix(intersection_matrix &im) const {
        topo_ops::update_intersection_matrix(_label,im);
    }

    friend std::ostream &operator<<(std::ostream &os,const labeled_edge_end_bundle &x) {
        return os << "bundle{(" << x.coordinate().x() << ' ' << x.coordinate().y() << ") x"
            << x._bundle.edge_ends().size() << ' ' << x._label << '}';
    }
};

/** The bundles around a node, after their labels are fully determined */
template<coordinate T> class labeled_edge_end_bundle_star {
    std::vector<labeled_edge_end_bundle<T>> _bundles;

    /* Walk around the node counter-clockwise. The right side of each area
    bundle must match the left side of the previous one, and bundles that don't
    bound an area take the position of the region they are in. */
    void propagate_side_labels(std::size_t geom_index) {
        std::optional<coord_pos> start;
        for(auto &b : _bundles) {
            if(b.label().is_geom_area(geom_index)) {
                auto left = b.label().position(geom_index,direction::left);
                if(left) start = left;
            }
        }
        if(!start) return;

        coord_pos current = *start;
        for(auto &b : _bundles) {
            topo_ops::label &lbl = b.label();
            if(!lbl.on_position(geom_index)) lbl.set_on_position(geom_index,current);

            if(lbl.is_geom_area(geom_index)) {
                auto left = lbl.position(geom_index,direction::left);
                auto right = lbl.position(geom_index,direction::right);
                if(right) {
                    if(*right != current) {
                        TOPO_OPS_DEBUG_LOG(
                            "side position conflict at ({},{}): right side is '{}' but expected '{}'. The input is probably invalid.",
                            b.coordinate().x(),
                            b.coordinate().y(),
                            to_char(*right),
                            to_char(current));
                    }
                    TOPO_OPS_ASSERT(left);
                    if(left) current = *left;
                } else {
                    TOPO_OPS_ASSERT(!left);
                    lbl.set_position(geom_index,direction::right,current);
                    lbl.set_position(geom_index,direction::left,current);
                }
            }
        }

        /* a full turn around the node ends in the region it started in */
        if(current != *start) {
            TOPO_OPS_DEBUG_LOG(
                "side positions around a node do not close: started at '{}' and ended at '{}'",
                to_char(*start),
                to_char(current));
        }
        TOPO_OPS_ASSERT(current == *start);
    }

public:
    explicit labeled_edge_end_bundle_star(std::vector<labeled_edge_end_bundle<T>> bundles)
        : _bundles(std::move(bundles)) {}

    const std::vector<labeled_edge_end_bundle<T>> &bundles() const noexcept { return _bundles; }

    /** Fill in every position of every bundle.

    Positions that can't be determined from the edges around the node are
    taken from the geometries themselves. */
    template<typename Kernel>
    void compute_labeling(const geometry_graph<T,Kernel> &graph_a,const geometry_graph<T,Kernel> &graph_b) {
        propagate_side_labels(0);
        propagate_side_labels(1);

        /* An edge that is a line for a geometry, but on that geometry's
        boundary, is an area that has collapsed */
        std::array<bool,2> has_dimensional_collapse_edge{false,false};
        for(auto &b : _bundles) {
            for(std::size_t i=0; i<2; ++i) {
                if(b.label().is_line(i) && b.label().on_position(i) == coord_pos::on_boundary) {
                    has_dimensional_collapse_edge[i] = true;
                }
            }
        }

        const std::array<const geometry_graph<T,Kernel>*,2> graphs{&graph_a,&graph_b};
        for(auto &b : _bundles) {
            topo_ops::label &lbl = b.label();
            for(std::size_t i=0; i<2; ++i) {
                if(!lbl.is_any_empty(i)) continue;

                coord_pos pos = coord_pos::outside;
                if(!has_dimensional_collapse_edge[i] && graphs[i]->parent_dimensions() == dimensions::area) {
                    pos = coordinate_position<Kernel>(graphs[i]->parent_geometry(),b.coordinate());
                }
                lbl.set_all_positions_if_empty(i,pos);
            }
        }
    }

    void update_intersection_matrix(intersection_matrix &im) const {
        for(auto &b : _bundles) b.update_intersection_matrix(im);
    }
};

/** The edge ends around a node, grouped into bundles and ordered by angle */
template<coordinate T,typename Kernel=robust_kernel> class edge_end_bundle_star {
    std::map<edge_end_key<T>,edge_end_bundle<T>,edge_end_key_less<Kernel>> _bundles;

public:
    void insert(edge_end<T> e) {
        auto itr = _bundles.try_emplace(e.key(),e.coordinate()).first;
        itr->second.insert(std::move(e));
    }

    std::size_t size() const noexcept { return _bundles.size(); }
    bool empty() const noexcept { return _bundles.empty(); }

    auto begin() const { return _bundles.begin(); }
    auto end() const { return _bundles.end(); }

    /** Combine the labels of each bundle and resolve the labels around the
    node. The bundles are moved into the result. */
    labeled_edge_end_bundle_star<T> into_labeled(
        const geometry_graph<T,Kernel> &graph_a,
        const geometry_graph<T,Kernel> &graph_b)
    {
        std::vector<labeled_edge_end_bundle<T>> labeled;
        labeled.reserve(_bundles.size());
        for(auto &[key,b] : _bundles) labeled.emplace_back(std::move(b));
        _bundles.clear();

        labeled_edge_end_bundle_star<T> r{std::move(labeled)};
        r.compute_labeling(graph_a,graph_b);
        return r;
    }
};

} // namespace topo_ops

#endif
