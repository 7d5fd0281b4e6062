#ifndef PRISM_ERROR_HPP
#define PRISM_ERROR_HPP

#include <stdexcept>
#include <string>

namespace prism {

// Misuse of the engine by scene-construction code. Never recovered internally.
struct precondition_error : std::logic_error {
    explicit precondition_error(const std::string &what) : std::logic_error(what) {}
};

struct parse_error : std::runtime_error {
    int line;
    parse_error(int line, const std::string &what) : std::runtime_error("line " + std::to_string(line) + ": " + what), line(line) {}
};

}

#endif
