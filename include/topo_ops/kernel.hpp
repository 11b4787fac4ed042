#ifndef TOPO_OPS_KERNEL_HPP
#define TOPO_OPS_KERNEL_HPP

#include <array>
#include <cstddef>
#include <ostream>

#include "base.hpp"


namespace topo_ops {

enum class orientation {counter_clockwise,clockwise,collinear};

inline std::ostream &operator<<(std::ostream &os,orientation x) {
    switch(x) {
    case orientation::counter_clockwise: return os << "counter_clockwise";
    case orientation::clockwise: return os << "clockwise";
    default: return os << "collinear";
    }
}

namespace detail {
template<typename T> constexpr orientation orientation_of(T det) {
    if(det > 0) return orientation::counter_clockwise;
    if(det < 0) return orientation::clockwise;
    return orientation::collinear;
}

/* The following are the error-free transformations from "Adaptive Precision
Floating-Point Arithmetic and Fast Robust Geometric Predicates" by Jonathan
Richard Shewchuk. */

/* "x + y" equals "a + b" exactly, where "x" is the rounded sum */
template<coordinate T> void two_sum(T a,T b,T &x,T &y) {
    x = a + b;
    T b_virtual = x - a;
    T a_virtual = x - b_virtual;
    T b_roundoff = b - b_virtual;
    T a_roundoff = a - a_virtual;
    y = a_roundoff + b_roundoff;
}

/* "x + y" equals "a * b" exactly, where "x" is the rounded product */
template<coordinate T> void two_product(T a,T b,T &x,T &y) {
    x = a * b;
    y = coord_ops<T>::fma(a,b,-x);
}

/* A sum of non-overlapping components in order of increasing magnitude. Zero
components are kept, which doesn't affect the sum or the sign. */
template<coordinate T,std::size_t N> class expansion {
    std::array<T,N> components;
    std::size_t count = 0;

public:
    void grow(T b) {
        TOPO_OPS_ASSERT(count < N);
        T q = b;
        for(std::size_t i=0; i<count; ++i) {
            T h;
            two_sum(q,components[i],q,h);
            components[i] = h;
        }
        components[count++] = q;
    }

    void grow_product(T a,T b) {
        T x, y;
        two_product(a,b,x,y);
        grow(y);
        grow(x);
    }

    /* The sign of the most significant non-zero component is the sign of the
    whole sum */
    int sign() const {
        for(std::size_t i=count; i>0; --i) {
            if(components[i-1] > 0) return 1;
            if(components[i-1] < 0) return -1;
        }
        return 0;
    }
};
} // namespace detail

/** Orientation predicate that evaluates the determinant directly in the
coordinate type.

This is fast, but near-collinear points may be misclassified, and different
argument orders of the same three points may disagree. */
struct simple_kernel {
    template<coordinate T>
    static orientation orient2d(const point_t<T> &p,const point_t<T> &q,const point_t<T> &r) {
        return detail::orientation_of((q.x() - p.x()) * (r.y() - p.y()) - (q.y() - p.y()) * (r.x() - p.x()));
    }
};

/** Orientation predicate that is exact for all finite inputs.

The determinant is first computed in floating point, and if the result is within
the error bound of zero, it is computed again exactly, using floating-point
expansions. */
struct robust_kernel {
    template<coordinate T>
    static orientation orient2d(const point_t<T> &p,const point_t<T> &q,const point_t<T> &r) {
        T det_left = (p.x() - r.x()) * (q.y() - r.y());
        T det_right = (p.y() - r.y()) * (q.x() - r.x());
        T det = det_left - det_right;
        T det_sum;

        if(det_left > 0) {
            if(det_right <= 0) return detail::orientation_of(det);
            det_sum = det_left + det_right;
        } else if(det_left < 0) {
            if(det_right >= 0) return detail::orientation_of(det);
            det_sum = -det_left - det_right;
        } else {
            return detail::orientation_of(det);
        }

        const T eps = coord_ops<T>::unit_roundoff();
        const T err_bound = (T(3) + T(16) * eps) * eps * det_sum;
        if(det >= err_bound || -det >= err_bound) return detail::orientation_of(det);

        return exact_orient2d(p,q,r);
    }

    /* (q-p)×(r-p) expanded into six products of the original coordinates,
    each of which is representable as the sum of two floating-point numbers */
    template<coordinate T>
    static orientation exact_orient2d(const point_t<T> &p,const point_t<T> &q,const point_t<T> &r) {
        detail::expansion<T,12> e;
        e.grow_product(q.x(),r.y());
        e.grow_product(-q.x(),p.y());
        e.grow_product(-p.x(),r.y());
        e.grow_product(-q.y(),r.x());
        e.grow_product(q.y(),p.x());
        e.grow_product(p.y(),r.x());
        int s = e.sign();
        return s > 0 ? orientation::counter_clockwise : (s < 0 ? orientation::clockwise : orientation::collinear);
    }
};

template<typename K,typename T> concept kernel = coordinate<T> && requires(const point_t<T> &p) {
    { K::orient2d(p,p,p) } -> std::same_as<orientation>;
};

} // namespace topo_ops

#endif
