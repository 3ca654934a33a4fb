#include "toon_encoder.hpp"
#include "toon_errors.hpp"
#include "toon_normalize.hpp"
#include "toon_primitives.hpp"
#include "toon_sexp.hpp"

#include <R_ext/Rdynload.h>

#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

using namespace toonenc;

// Helper to emit warnings from the normalizer
static void emit_warnings(const std::vector<Warning>& warnings) {
    for (const auto& w : warnings) {
        Rf_warning("%s", w.message.c_str());
    }
}

static int as_max_depth(SEXP max_depth) {
    int depth = Rf_asInteger(max_depth);
    if (depth == NA_INTEGER || depth < 0) {
        throw std::invalid_argument("max_depth must be a non-negative integer");
    }
    return depth;
}

static char as_delimiter(SEXP delimiter) {
    if (TYPEOF(delimiter) != STRSXP || Rf_xlength(delimiter) != 1 ||
        STRING_ELT(delimiter, 0) == NA_STRING) {
        throw std::invalid_argument("delimiter must be a single string");
    }
    const char* d = CHAR(STRING_ELT(delimiter, 0));
    if (std::strcmp(d, ",") == 0) return DELIM_COMMA;
    if (std::strcmp(d, "\t") == 0) return DELIM_TAB;
    throw std::invalid_argument("delimiter must be \",\" or \"\\t\"");
}

extern "C" {

// Encode R object to TOON string
SEXP C_to_toon(SEXP x, SEXP sanitize, SEXP indent, SEXP max_depth, SEXP warn) {
    try {
        EncodeOptions opts;
        opts.sanitize = Rf_asLogical(sanitize) == TRUE;
        opts.indent = Rf_asInteger(indent);
        opts.max_depth = as_max_depth(max_depth);
        opts.warn = Rf_asLogical(warn) == TRUE;
        if (opts.indent == NA_INTEGER) {
            throw std::invalid_argument("indent must be a non-negative integer");
        }

        Encoder encoder(opts);
        HostValuePtr host = sexp_to_host(x, opts.max_depth);
        std::string result = encoder.encode(*host);
        emit_warnings(encoder.warnings());

        SEXP out = PROTECT(Rf_allocVector(STRSXP, 1));
        SET_STRING_ELT(out, 0, Rf_mkCharCE(result.c_str(), CE_UTF8));

        // Set class
        SEXP class_attr = PROTECT(Rf_allocVector(STRSXP, 1));
        SET_STRING_ELT(class_attr, 0, Rf_mkChar("toon"));
        Rf_setAttrib(out, R_ClassSymbol, class_attr);

        UNPROTECT(2);
        return out;
    } catch (const InvalidValueError& e) {
        Rf_error("%s", e.formatted_message().c_str());
    } catch (const DepthExceededError& e) {
        Rf_error("%s", e.formatted_message().c_str());
    } catch (const std::exception& e) {
        Rf_error("Error encoding to TOON: %s", e.what());
    }

    return R_NilValue;
}

// Normalize R object to its canonical form
SEXP C_toon_normalize(SEXP x, SEXP sanitize, SEXP max_depth, SEXP simplify) {
    try {
        NormalizeOptions opts;
        opts.mode = Rf_asLogical(sanitize) == TRUE ? NormalizeMode::SANITIZE : NormalizeMode::STRICT;
        opts.max_depth = as_max_depth(max_depth);
        opts.warn = false;

        Normalizer normalizer(opts);
        HostValuePtr host = sexp_to_host(x, opts.max_depth);
        ValuePtr v = normalizer.normalize(*host);

        return value_to_sexp(v, Rf_asLogical(simplify) == TRUE);
    } catch (const InvalidValueError& e) {
        Rf_error("%s", e.formatted_message().c_str());
    } catch (const DepthExceededError& e) {
        Rf_error("%s", e.formatted_message().c_str());
    } catch (const std::exception& e) {
        Rf_error("Error normalizing value: %s", e.what());
    }

    return R_NilValue;
}

// Canonical decimal text for each element of a numeric vector
SEXP C_toon_encode_number(SEXP x) {
    try {
        SEXP num = PROTECT(Rf_coerceVector(x, REALSXP));
        R_xlen_t n = Rf_xlength(num);
        SEXP out = PROTECT(Rf_allocVector(STRSXP, n));

        for (R_xlen_t i = 0; i < n; i++) {
            double val = REAL(num)[i];
            if (ISNA(val)) {
                SET_STRING_ELT(out, i, NA_STRING);
            } else {
                SET_STRING_ELT(out, i, Rf_mkChar(encode_number(val).c_str()));
            }
        }

        UNPROTECT(2);
        return out;
    } catch (const std::exception& e) {
        Rf_error("Error encoding number: %s", e.what());
    }

    return R_NilValue;
}

// Quoted-if-needed token for each element of a character vector
SEXP C_toon_encode_string(SEXP x, SEXP delimiter) {
    try {
        if (TYPEOF(x) != STRSXP) {
            throw std::invalid_argument("x must be a character vector");
        }
        char delim = as_delimiter(delimiter);
        R_xlen_t n = Rf_xlength(x);
        SEXP out = PROTECT(Rf_allocVector(STRSXP, n));

        for (R_xlen_t i = 0; i < n; i++) {
            SEXP elem = STRING_ELT(x, i);
            if (elem == NA_STRING) {
                SET_STRING_ELT(out, i, NA_STRING);
            } else {
                std::string token = encode_string(Rf_translateCharUTF8(elem), delim);
                SET_STRING_ELT(out, i, Rf_mkCharCE(token.c_str(), CE_UTF8));
            }
        }

        UNPROTECT(1);
        return out;
    } catch (const std::exception& e) {
        Rf_error("Error encoding string: %s", e.what());
    }

    return R_NilValue;
}

static const R_CallMethodDef CallEntries[] = {
    {"C_to_toon", (DL_FUNC) &C_to_toon, 5},
    {"C_toon_normalize", (DL_FUNC) &C_toon_normalize, 4},
    {"C_toon_encode_number", (DL_FUNC) &C_toon_encode_number, 1},
    {"C_toon_encode_string", (DL_FUNC) &C_toon_encode_string, 2},
    {NULL, NULL, 0}
};

void R_init_toonenc(DllInfo* dll) {
    R_registerRoutines(dll, NULL, CallEntries, NULL, NULL);
    R_useDynamicSymbols(dll, FALSE);
}

} // extern "C"
