/* Printers for test failure messages. The methods here assume the coordinate
type is always "coord_t".
*/

#ifndef stream_output_hpp
#define stream_output_hpp

#include <vector>
#include <ostream>
#include <utility>
#include <type_traits>

#include "../include/topo_ops/base.hpp"

template<typename T> struct _pp {
    T value;
    unsigned int indent;
};

struct indent_t {
    unsigned int amount;
};
inline indent_t operator+(indent_t a,unsigned int b) {
    return {a.amount+b};
}

inline std::ostream &operator<<(std::ostream &os,indent_t indent) {
    os << '\n';
    for(unsigned int i=0; i<indent.amount; ++i) os << "  ";
    return os;
}

template<typename T> _pp<T> pp(T &&x,unsigned int indent) { return _pp<T>{std::forward<T>(x),indent}; }
template<typename T> _pp<T> pp(T &&x,indent_t indent) { return _pp<T>{std::forward<T>(x),indent.amount}; }

template<typename T> struct pp_printer {
    void operator()(std::ostream &os,indent_t,const T &x) const {
        os << x;
    }
};

template<typename Coord> struct pp_printer<topo_ops::point_t<Coord>> {
    void operator()(std::ostream &os,indent_t,const topo_ops::point_t<Coord> &x) const {
        os << "point_t<coord_t>(" << x[0] << ',' << x[1] << ')';
    }
};

template<typename T,typename Alloc> struct pp_printer<std::vector<T,Alloc>> {
    void operator()(std::ostream &os,indent_t indent,const std::vector<T,Alloc> &x) const {
        os << "std::vector{";
        bool started = false;
        indent = indent + 1;
        for(const auto &item : x) {
            if(started) os << ',';
            started = true;
            if(x.size() > 1) os << indent;
            os << pp(item,indent);
        }
        os << '}';
    }
};

template<typename T> std::ostream &operator<<(std::ostream &os,const _pp<T> &x) {
    pp_printer<std::remove_cvref_t<T>>{}(os,indent_t{x.indent},x.value);
    return os;
}

#endif
