/**
 * @file Payload.hpp
 * @brief Immutable tagged value carried on manifold nodes and parameters
 *
 * INTERNAL TO CORE — the C API exposes payloads only as real / text reads.
 *
 * A Payload is one of NONE, BOOL, INT, REAL, TEXT or VECTOR. Once a node
 * is computed its payload is held by PayloadRef (shared, const) and handed
 * to any number of dependents without copying.
 */

#ifndef UOR_PAYLOAD_HPP
#define UOR_PAYLOAD_HPP

#include "uor/uor_abi.h"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace uor {

/* ================================================================== */
/*  Payload — tagged value                                             */
/* ================================================================== */

class Payload {
public:
    Payload() = default;

    static Payload none() { return Payload(); }
    static Payload boolean(bool v);
    static Payload integer(int64_t v);
    static Payload real(double v);
    static Payload text(std::string v);
    static Payload vector(std::vector<double> v);

    uor_payload_kind kind() const { return kind_; }
    bool is_none() const    { return kind_ == UOR_PAYLOAD_NONE; }
    bool is_numeric() const {
        return kind_ == UOR_PAYLOAD_INT || kind_ == UOR_PAYLOAD_REAL;
    }

    /** True if this concrete kind satisfies a contract kind (ANY, NUMERIC). */
    bool matches(uor_payload_kind want) const;

    bool                       as_bool() const   { return b_; }
    int64_t                    as_int() const    { return i_; }
    /** INT promotes to REAL; BOOL reads as 0/1; other kinds read as 0. */
    double                     as_real() const;
    const std::string&         as_text() const   { return s_; }
    const std::vector<double>& as_vector() const { return v_; }

    /** Human-readable rendering: 12, 3.5, "abc", [1, 2, 3], true, none. */
    std::string to_string() const;

    /** Stable FNV-1a hash over kind + content. Equal payloads hash equal. */
    uint64_t fingerprint() const;

    bool operator==(const Payload& o) const;
    bool operator!=(const Payload& o) const { return !(*this == o); }

private:
    uor_payload_kind    kind_ = UOR_PAYLOAD_NONE;
    bool                b_    = false;
    int64_t             i_    = 0;
    double              r_    = 0.0;
    std::string         s_;
    std::vector<double> v_;
};

using PayloadRef = std::shared_ptr<const Payload>;

inline PayloadRef make_payload(Payload p) {
    return std::make_shared<const Payload>(std::move(p));
}

/**
 * Append the numeric content of `p` to `out`: INT/REAL as one element,
 * VECTOR element-wise. Returns false for any other kind.
 */
bool append_numeric(const Payload& p, std::vector<double>& out);

/* ================================================================== */
/*  ParamBag — ordered name → value map                                */
/* ================================================================== */

using ParamBag = std::map<std::string, Payload>;

/** Lookup; nullptr when absent. */
const Payload* find_param(const ParamBag& params, const std::string& name);

/** Numeric parameter with fallback for missing / non-numeric values. */
double param_real(const ParamBag& params, const std::string& name, double fallback);

/** Order-stable hash of every (name, value) pair. */
uint64_t fingerprint(const ParamBag& params);

} // namespace uor

#endif // UOR_PAYLOAD_HPP
