#ifndef KGVIZ_COMMON_ERRORS_HPP
#define KGVIZ_COMMON_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace kgviz {

// The host environment could not provide a resource the session needs
// (window, GL context, output surface). Layout faults never raise this.
class InitializationError : public std::runtime_error {
public:
    explicit InitializationError(const std::string& what)
        : std::runtime_error(what) {}
};

}  // namespace kgviz

#endif // KGVIZ_COMMON_ERRORS_HPP
