#include "toon_sexp.hpp"
#include "toon_errors.hpp"
#include <cstdint>
#include <cstring>
#include <limits>
#include <string>

namespace toonenc {

namespace {

// Vector-level classes that change how elements are read
enum class AtomicClass {
    PLAIN,
    FACTOR,
    DATE,
    POSIXCT,
    INTEGER64
};

constexpr double MS_PER_DAY = 86400000.0;

AtomicClass atomic_class(SEXP x) {
    if (TYPEOF(x) == INTSXP && Rf_getAttrib(x, R_LevelsSymbol) != R_NilValue) {
        return AtomicClass::FACTOR;
    }
    if (Rf_inherits(x, "Date")) return AtomicClass::DATE;
    if (Rf_inherits(x, "POSIXct")) return AtomicClass::POSIXCT;
    if (TYPEOF(x) == REALSXP && Rf_inherits(x, "integer64")) return AtomicClass::INTEGER64;
    return AtomicClass::PLAIN;
}

// Numeric payload of a Date/POSIXct element; NA maps to NA_REAL
double time_elt(SEXP x, R_xlen_t i) {
    if (TYPEOF(x) == INTSXP) {
        int v = INTEGER(x)[i];
        return v == NA_INTEGER ? NA_REAL : static_cast<double>(v);
    }
    return REAL(x)[i];
}

HostValuePtr atomic_elt(SEXP x, R_xlen_t i, AtomicClass cls) {
    switch (cls) {
        case AtomicClass::FACTOR: {
            int idx = INTEGER(x)[i];
            if (idx == NA_INTEGER) return HostValue::make_null();
            SEXP levels = Rf_getAttrib(x, R_LevelsSymbol);
            return HostValue::make_string(CHAR(STRING_ELT(levels, idx - 1)));
        }
        case AtomicClass::DATE: {
            double days = time_elt(x, i);
            if (ISNA(days)) return HostValue::make_null();
            return HostValue::make_date(days * MS_PER_DAY);
        }
        case AtomicClass::POSIXCT: {
            double secs = time_elt(x, i);
            if (ISNA(secs)) return HostValue::make_null();
            return HostValue::make_date(secs * 1000.0);
        }
        case AtomicClass::INTEGER64: {
            int64_t v;
            std::memcpy(&v, &REAL(x)[i], sizeof(v));
            if (v == std::numeric_limits<int64_t>::min()) return HostValue::make_null();
            return HostValue::make_bigint(std::to_string(v));
        }
        case AtomicClass::PLAIN:
            break;
    }

    switch (TYPEOF(x)) {
        case LGLSXP: {
            int v = LOGICAL(x)[i];
            if (v == NA_LOGICAL) return HostValue::make_null();
            return HostValue::make_bool(v != 0);
        }
        case INTSXP: {
            int v = INTEGER(x)[i];
            if (v == NA_INTEGER) return HostValue::make_null();
            return HostValue::make_number(static_cast<double>(v));
        }
        case REALSXP: {
            // NA is missing data; NaN and Inf stay numbers for the normalizer
            double v = REAL(x)[i];
            if (ISNA(v)) return HostValue::make_null();
            return HostValue::make_number(v);
        }
        case STRSXP: {
            SEXP elem = STRING_ELT(x, i);
            if (elem == NA_STRING) return HostValue::make_null();
            return HostValue::make_string(Rf_translateCharUTF8(elem));
        }
        default:
            break;
    }
    return HostValue::make_null();
}

HostValuePtr atomic_to_host(SEXP x) {
    R_xlen_t n = Rf_xlength(x);
    AtomicClass cls = atomic_class(x);

    if (n == 1) {
        return atomic_elt(x, 0, cls);
    }

    auto out = HostValue::make_array();
    out->array_items.reserve(static_cast<size_t>(n));
    for (R_xlen_t i = 0; i < n; i++) {
        out->push(atomic_elt(x, i, cls));
    }
    return out;
}

std::string name_at(SEXP names, R_xlen_t i) {
    SEXP name_elem = STRING_ELT(names, i);
    return (name_elem != NA_STRING) ? std::string(Rf_translateCharUTF8(name_elem)) : std::string();
}

HostValuePtr instance_of(SEXP x) {
    SEXP klass = Rf_getAttrib(x, R_ClassSymbol);
    std::string type = (klass != R_NilValue && Rf_xlength(klass) > 0)
        ? std::string(CHAR(STRING_ELT(klass, 0)))
        : std::string(Rf_type2char(TYPEOF(x)));
    return HostValue::make_instance(type, "<" + type + ">");
}

HostValuePtr to_host(SEXP x, int depth, int max_depth);

// data.frame: one object per row, columns in order
HostValuePtr dataframe_to_host(SEXP df, int depth, int max_depth) {
    SEXP names = Rf_getAttrib(df, R_NamesSymbol);
    R_xlen_t ncol = Rf_xlength(df);
    R_xlen_t nrow = (ncol > 0) ? Rf_xlength(VECTOR_ELT(df, 0)) : 0;

    auto out = HostValue::make_array();
    out->array_items.reserve(static_cast<size_t>(nrow));

    for (R_xlen_t i = 0; i < nrow; i++) {
        auto row = HostValue::make_object();
        for (R_xlen_t j = 0; j < ncol; j++) {
            SEXP col = VECTOR_ELT(df, j);
            std::string name = (names != R_NilValue) ? name_at(names, j) : std::string();

            if (TYPEOF(col) == VECSXP) {
                // List column
                row->set(name, to_host(VECTOR_ELT(col, i), depth + 2, max_depth));
            } else if (Rf_isVectorAtomic(col)) {
                row->set(name, atomic_elt(col, i, atomic_class(col)));
            } else {
                row->set(name, instance_of(col));
            }
        }
        out->push(row);
    }
    return out;
}

HostValuePtr list_to_host(SEXP x, int depth, int max_depth) {
    SEXP names = Rf_getAttrib(x, R_NamesSymbol);
    R_xlen_t n = Rf_xlength(x);

    if (names == R_NilValue || Rf_xlength(names) != n) {
        // Unnamed list = array
        auto out = HostValue::make_array();
        out->array_items.reserve(static_cast<size_t>(n));
        for (R_xlen_t i = 0; i < n; i++) {
            out->push(to_host(VECTOR_ELT(x, i), depth + 1, max_depth));
        }
        return out;
    }

    // Named list = object
    auto out = HostValue::make_object();
    for (R_xlen_t i = 0; i < n; i++) {
        out->set(name_at(names, i), to_host(VECTOR_ELT(x, i), depth + 1, max_depth));
    }
    return out;
}

HostValuePtr to_host(SEXP x, int depth, int max_depth) {
    if (depth > max_depth) {
        throw DepthExceededError(max_depth);
    }

    if (x == R_NilValue) return HostValue::make_null();
    if (x == R_MissingArg) return HostValue::make_undefined();

    if (Rf_inherits(x, "data.frame")) {
        return dataframe_to_host(x, depth, max_depth);
    }

    switch (TYPEOF(x)) {
        case LGLSXP:
        case INTSXP:
        case REALSXP:
        case STRSXP:
            return atomic_to_host(x);

        case VECSXP: {
            SEXP klass = Rf_getAttrib(x, R_ClassSymbol);
            if (klass != R_NilValue && !Rf_inherits(x, "list")) {
                return instance_of(x);
            }
            return list_to_host(x, depth, max_depth);
        }

        case CLOSXP:
        case BUILTINSXP:
        case SPECIALSXP:
            return HostValue::make_function();

        case SYMSXP:
            return HostValue::make_symbol(CHAR(PRINTNAME(x)));

        default:
            // Environments, external pointers, S4, raw, complex, calls
            return instance_of(x);
    }
}

} // namespace

HostValuePtr sexp_to_host(SEXP x, int max_depth) {
    return to_host(x, 0, max_depth);
}

SEXP value_to_sexp(const ValuePtr& v, bool simplify) {
    if (!v) return R_NilValue;

    switch (v->kind) {
        case ValueKind::V_NULL:
            return R_NilValue;

        case ValueKind::V_BOOL:
            return Rf_ScalarLogical(v->bool_val ? TRUE : FALSE);

        case ValueKind::V_NUMBER:
            return Rf_ScalarReal(v->number_val);

        case ValueKind::V_STRING:
            return Rf_ScalarString(Rf_mkCharCE(v->string_val.c_str(), CE_UTF8));

        case ValueKind::V_ARRAY: {
            size_t n = v->array_items.size();

            if (simplify && n > 0) {
                // Check if all items are same primitive type
                ValueKind first_kind = ValueKind::V_NULL;
                bool all_same = true;

                for (const auto& item : v->array_items) {
                    if (!item->is_primitive()) {
                        all_same = false;
                        break;
                    }
                    if (item->kind == ValueKind::V_NULL) continue;
                    if (first_kind == ValueKind::V_NULL) {
                        first_kind = item->kind;
                    } else if (item->kind != first_kind) {
                        all_same = false;
                        break;
                    }
                }

                if (all_same && first_kind != ValueKind::V_NULL) {
                    switch (first_kind) {
                        case ValueKind::V_BOOL: {
                            SEXP result = PROTECT(Rf_allocVector(LGLSXP, n));
                            int* data = LOGICAL(result);
                            for (size_t i = 0; i < n; i++) {
                                const auto& item = v->array_items[i];
                                data[i] = item->kind == ValueKind::V_NULL ? NA_LOGICAL
                                        : (item->bool_val ? TRUE : FALSE);
                            }
                            UNPROTECT(1);
                            return result;
                        }
                        case ValueKind::V_NUMBER: {
                            SEXP result = PROTECT(Rf_allocVector(REALSXP, n));
                            double* data = REAL(result);
                            for (size_t i = 0; i < n; i++) {
                                const auto& item = v->array_items[i];
                                data[i] = item->kind == ValueKind::V_NULL ? NA_REAL : item->number_val;
                            }
                            UNPROTECT(1);
                            return result;
                        }
                        case ValueKind::V_STRING: {
                            SEXP result = PROTECT(Rf_allocVector(STRSXP, n));
                            for (size_t i = 0; i < n; i++) {
                                const auto& item = v->array_items[i];
                                if (item->kind == ValueKind::V_NULL) {
                                    SET_STRING_ELT(result, i, NA_STRING);
                                } else {
                                    SET_STRING_ELT(result, i, Rf_mkCharCE(item->string_val.c_str(), CE_UTF8));
                                }
                            }
                            UNPROTECT(1);
                            return result;
                        }
                        default:
                            break;
                    }
                }
            }

            // Return as list
            SEXP result = PROTECT(Rf_allocVector(VECSXP, n));
            for (size_t i = 0; i < n; i++) {
                SET_VECTOR_ELT(result, i, value_to_sexp(v->array_items[i], simplify));
            }
            UNPROTECT(1);
            return result;
        }

        case ValueKind::V_OBJECT: {
            size_t n = v->object_items.size();
            SEXP result = PROTECT(Rf_allocVector(VECSXP, n));
            SEXP names = PROTECT(Rf_allocVector(STRSXP, n));

            for (size_t i = 0; i < n; i++) {
                SET_STRING_ELT(names, i, Rf_mkCharCE(v->object_items[i].first.c_str(), CE_UTF8));
                SET_VECTOR_ELT(result, i, value_to_sexp(v->object_items[i].second, simplify));
            }

            Rf_setAttrib(result, R_NamesSymbol, names);
            UNPROTECT(2);
            return result;
        }
    }

    return R_NilValue;
}

} // namespace toonenc
