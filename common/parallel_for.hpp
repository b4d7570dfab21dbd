#ifndef WASHIWRAP_COMMON_PARALLEL_FOR_HPP
#define WASHIWRAP_COMMON_PARALLEL_FOR_HPP

#include <atomic>
#include <cstddef>
#include <exception>
#include <vector>

namespace washiwrap {

// Calls body(i) for every i in [0, count), spread over OpenMP threads when
// count exceeds serial_limit. Once an iteration throws, iterations not yet
// started are skipped and the exception is rethrown on the calling thread
// after the loop; with several, the lowest index wins.
template <typename Body>
void parallel_for(size_t count, size_t serial_limit, Body&& body) {
    std::vector<std::exception_ptr> errors(count);
    std::atomic<bool> failed{false};

    #pragma omp parallel for schedule(dynamic) if(count > serial_limit)
    for (size_t i = 0; i < count; ++i) {
        if (failed.load()) continue;
        try {
            body(i);
        } catch (...) {
            errors[i] = std::current_exception();
            failed.store(true);
        }
    }

    for (const auto& error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }
}

}  // namespace washiwrap

#endif // WASHIWRAP_COMMON_PARALLEL_FOR_HPP
