/**
 * @file payload.cpp
 * @brief Payload construction, rendering and fingerprinting
 */

#include "uor/Payload.hpp"

#include <cinttypes>
#include <cstdio>
#include <cstring>

namespace uor {

/* -- Factories ---------------------------------------------------- */

Payload Payload::boolean(bool v) {
    Payload p; p.kind_ = UOR_PAYLOAD_BOOL; p.b_ = v; return p;
}

Payload Payload::integer(int64_t v) {
    Payload p; p.kind_ = UOR_PAYLOAD_INT; p.i_ = v; return p;
}

Payload Payload::real(double v) {
    Payload p; p.kind_ = UOR_PAYLOAD_REAL; p.r_ = v; return p;
}

Payload Payload::text(std::string v) {
    Payload p; p.kind_ = UOR_PAYLOAD_TEXT; p.s_ = std::move(v); return p;
}

Payload Payload::vector(std::vector<double> v) {
    Payload p; p.kind_ = UOR_PAYLOAD_VECTOR; p.v_ = std::move(v); return p;
}

/* -- Accessors ---------------------------------------------------- */

bool Payload::matches(uor_payload_kind want) const {
    if (want == UOR_PAYLOAD_ANY) return true;
    if (want == UOR_PAYLOAD_NUMERIC) return is_numeric();
    return kind_ == want;
}

double Payload::as_real() const {
    switch (kind_) {
        case UOR_PAYLOAD_REAL: return r_;
        case UOR_PAYLOAD_INT:  return static_cast<double>(i_);
        case UOR_PAYLOAD_BOOL: return b_ ? 1.0 : 0.0;
        default:               return 0.0;
    }
}

static void append_real(std::string& s, double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%g", v);
    s += buf;
}

std::string Payload::to_string() const {
    std::string s;
    switch (kind_) {
        case UOR_PAYLOAD_NONE: s = "none"; break;
        case UOR_PAYLOAD_BOOL: s = b_ ? "true" : "false"; break;
        case UOR_PAYLOAD_INT: {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%" PRId64, i_);
            s = buf;
            break;
        }
        case UOR_PAYLOAD_REAL: append_real(s, r_); break;
        case UOR_PAYLOAD_TEXT: s = "\"" + s_ + "\""; break;
        case UOR_PAYLOAD_VECTOR:
            s = "[";
            for (size_t i = 0; i < v_.size(); ++i) {
                if (i) s += ", ";
                append_real(s, v_[i]);
            }
            s += "]";
            break;
        default: s = "?"; break;
    }
    return s;
}

/* -- FNV-1a ------------------------------------------------------- */

static constexpr uint64_t kFnvOffset = 0xcbf29ce484222325ULL;
static constexpr uint64_t kFnvPrime  = 0x100000001b3ULL;

static uint64_t fnv1a(uint64_t h, const void* data, size_t n) {
    auto* p = static_cast<const unsigned char*>(data);
    for (size_t i = 0; i < n; ++i) {
        h ^= p[i];
        h *= kFnvPrime;
    }
    return h;
}

static uint64_t fnv1a_real(uint64_t h, double v) {
    uint64_t bits;
    std::memcpy(&bits, &v, sizeof(bits));
    return fnv1a(h, &bits, sizeof(bits));
}

uint64_t Payload::fingerprint() const {
    uint64_t h = kFnvOffset;
    uint8_t k = static_cast<uint8_t>(kind_);
    h = fnv1a(h, &k, 1);
    switch (kind_) {
        case UOR_PAYLOAD_BOOL: { uint8_t v = b_ ? 1 : 0; h = fnv1a(h, &v, 1); break; }
        case UOR_PAYLOAD_INT:  h = fnv1a(h, &i_, sizeof(i_)); break;
        case UOR_PAYLOAD_REAL: h = fnv1a_real(h, r_); break;
        case UOR_PAYLOAD_TEXT: {
            uint64_t n = s_.size();
            h = fnv1a(h, &n, sizeof(n));
            h = fnv1a(h, s_.data(), s_.size());
            break;
        }
        case UOR_PAYLOAD_VECTOR: {
            uint64_t n = v_.size();
            h = fnv1a(h, &n, sizeof(n));
            for (double d : v_) h = fnv1a_real(h, d);
            break;
        }
        default: break;
    }
    return h;
}

bool Payload::operator==(const Payload& o) const {
    if (kind_ != o.kind_) return false;
    switch (kind_) {
        case UOR_PAYLOAD_BOOL:   return b_ == o.b_;
        case UOR_PAYLOAD_INT:    return i_ == o.i_;
        case UOR_PAYLOAD_REAL:   return r_ == o.r_;
        case UOR_PAYLOAD_TEXT:   return s_ == o.s_;
        case UOR_PAYLOAD_VECTOR: return v_ == o.v_;
        default:                 return true;
    }
}

bool append_numeric(const Payload& p, std::vector<double>& out) {
    if (p.is_numeric()) {
        out.push_back(p.as_real());
        return true;
    }
    if (p.kind() == UOR_PAYLOAD_VECTOR) {
        out.insert(out.end(), p.as_vector().begin(), p.as_vector().end());
        return true;
    }
    return false;
}

/* -- ParamBag ----------------------------------------------------- */

const Payload* find_param(const ParamBag& params, const std::string& name) {
    auto it = params.find(name);
    return it == params.end() ? nullptr : &it->second;
}

double param_real(const ParamBag& params, const std::string& name, double fallback) {
    const Payload* p = find_param(params, name);
    if (!p || !p->is_numeric()) return fallback;
    return p->as_real();
}

uint64_t fingerprint(const ParamBag& params) {
    uint64_t h = kFnvOffset;
    for (auto& [name, value] : params) {
        uint64_t n = name.size();
        h = fnv1a(h, &n, sizeof(n));
        h = fnv1a(h, name.data(), name.size());
        uint64_t vh = value.fingerprint();
        h = fnv1a(h, &vh, sizeof(vh));
    }
    return h;
}

} // namespace uor
