#ifndef STRATA_CORE_COLOR_H_
#define STRATA_CORE_COLOR_H_

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iostream>

#include "core/constants.h"

namespace strata {

struct RGB {
  public:
    RGB() : c{0, 0, 0} {}
    RGB(Float r, Float g, Float b) : c{r, g, b} {}
    explicit RGB(Float v) : c{v, v, v} {}

    Float r() const { return c[0]; }
    Float g() const { return c[1]; }
    Float b() const { return c[2]; }

    Float operator[](int i) const { return c[i]; }
    Float& operator[](int i) { return c[i]; }

    RGB& operator+=(const RGB& v) {
        c[0] += v.c[0];
        c[1] += v.c[1];
        c[2] += v.c[2];
        return *this;
    }

    RGB& operator*=(Float t) {
        c[0] *= t;
        c[1] *= t;
        c[2] *= t;
        return *this;
    }

    RGB& operator/=(Float t) {
        Float a = 1.0 / t;
        c[0] *= a;
        c[1] *= a;
        c[2] *= a;
        return *this;
    }

    bool HasNaNs() const { return std::isnan(c[0]) || std::isnan(c[1]) || std::isnan(c[2]); }
    bool IsBlack() const { return c[0] == 0 && c[1] == 0 && c[2] == 0; }

    RGB Clamp(Float min = 0.0, Float max = 1.0) const {
        return RGB(std::clamp(c[0], min, max), std::clamp(c[1], min, max),
                   std::clamp(c[2], min, max));
    }

  private:
    Float c[3];
};

inline std::ostream& operator<<(std::ostream& out, const RGB& c) {
    return out << c.r() << ' ' << c.g() << ' ' << c.b();
}

inline RGB operator+(const RGB& c, const RGB& d) {
    return RGB(c.r() + d.r(), c.g() + d.g(), c.b() + d.b());
}

inline RGB operator-(const RGB& c, const RGB& d) {
    return RGB(c.r() - d.r(), c.g() - d.g(), c.b() - d.b());
}

inline RGB operator*(const RGB& c, const RGB& d) {
    return RGB(c.r() * d.r(), c.g() * d.g(), c.b() * d.b());
}

inline RGB operator*(Float t, const RGB& c) { return RGB(t * c.r(), t * c.g(), t * c.b()); }

inline RGB operator*(const RGB& c, Float t) { return t * c; }

inline RGB operator/(const RGB& c, Float t) { return c * (1.0 / t); }

// Gamma 2 transfer, the inverse of the square used by the display path
inline Float LinearToGamma(Float linear) { return linear > 0 ? std::sqrt(linear) : 0; }

// Linear component -> display byte. Gamma values above 1 saturate at 255.
inline uint8_t ToDisplayByte(Float linear) {
    Float g = std::clamp(LinearToGamma(linear), 0.0, 1.0);
    return static_cast<uint8_t>(255.999 * g);
}

}  // namespace strata

#endif  // STRATA_CORE_COLOR_H_
