#ifndef TOPO_OPS_TOPO_OPS_HPP
#define TOPO_OPS_TOPO_OPS_HPP

#include "base.hpp"
#include "kernel.hpp"
#include "position.hpp"
#include "geometry.hpp"
#include "line_intersector.hpp"
#include "intersection_matrix.hpp"
#include "relate.hpp"
#include "prepared_geometry.hpp"

#endif
