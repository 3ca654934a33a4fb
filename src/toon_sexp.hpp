#ifndef TOON_SEXP_HPP
#define TOON_SEXP_HPP

#include "toon_host.hpp"
#include "toon_value.hpp"

#include <R.h>
#include <Rinternals.h>
#ifdef error
#undef error
#endif
#ifdef length
#undef length
#endif
#ifdef Realloc
#undef Realloc
#endif
#ifdef Free
#undef Free
#endif

namespace toonenc {

// Classify an R object as a host value. Length-1 atomic vectors become
// scalars, data.frames become arrays of row objects. Throws
// DepthExceededError for lists nested deeper than max_depth.
HostValuePtr sexp_to_host(SEXP x, int max_depth = 1000);

// Canonical tree back to R. With simplify, arrays of one primitive kind
// (nulls aside) come back as atomic vectors with NA for null.
SEXP value_to_sexp(const ValuePtr& v, bool simplify);

} // namespace toonenc

#endif // TOON_SEXP_HPP
