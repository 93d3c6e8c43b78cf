#ifndef NEBULA_TEST_UTIL_HPP
#define NEBULA_TEST_UTIL_HPP

#include <stdexcept>

// Run f and return the exception of type E it throws, so that its fields can be checked.
// Any other exception propagates and fails the test.

template <class E, class F>
E expect_throw(F f) {
    try {
        f() ;
    }
    catch ( E &e ) {
        return e ;
    }
    throw std::runtime_error("expected exception was not thrown") ;
}

#endif
