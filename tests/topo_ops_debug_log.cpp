#define TOPO_OPS_DEBUG_LOG(...) \
    (std::cout << std::format(__VA_ARGS__) << '\n')

#include <format>
#include <iostream>
#include <fstream>
#include <string>
#include <cerrno>
#include <cstring>
#include <exception>

#include "wkt_input.hpp"
#include "../include/topo_ops/topo_ops.hpp"


/* The input file has the WKT of the first geometry on the first line and the
WKT of the second geometry on the second line */
int main(int argc,char **argv) {
    if(argc != 2) {
        std::cerr << "exactly one argument is required\n";
        return 1;
    }

    std::ifstream is(argv[1]);
    if(!is.is_open()) {
        std::cerr << "failed to open " << argv[1] << ": " << std::strerror(errno) << '\n';
        return 1;
    }

    std::string line_a, line_b;
    if(!std::getline(is,line_a) || !std::getline(is,line_b)) {
        std::cerr << "the input must have two lines\n";
        return 1;
    }

    try {
        topo_ops::geometry<double> a = read_wkt(line_a);
        topo_ops::geometry<double> b = read_wkt(line_b);
        std::cout << topo_ops::relate(a,b) << std::endl;
    } catch(const std::exception &e) {
        std::cerr << "invalid input: " << e.what() << '\n';
        return 1;
    }

    return 0;
}
