#pragma once
#include <algorithm>
#include <cmath>

namespace aqua
{
    struct Vec2
    {
        float x = 0.f, y = 0.f;

        constexpr Vec2() = default;

        constexpr Vec2(const float X, const float Y): x(X), y(Y)
        {
        }

        constexpr Vec2 operator+(const Vec2 &o) const
        {
            return {x + o.x, y + o.y};
        }

        constexpr Vec2 operator-(const Vec2 &o) const
        {
            return {x - o.x, y - o.y};
        }

        constexpr Vec2 operator*(const float s) const
        {
            return {x * s, y * s};
        }

        constexpr Vec2 operator/(const float s) const
        {
            return {x / s, y / s};
        }

        Vec2 &operator+=(const Vec2 &o)
        {
            x += o.x;
            y += o.y;
            return *this;
        }

        Vec2 &operator-=(const Vec2 &o)
        {
            x -= o.x;
            y -= o.y;
            return *this;
        }

        Vec2 &operator*=(const float s)
        {
            x *= s;
            y *= s;
            return *this;
        }
    };

    inline float dot(const Vec2 &a, const Vec2 &b)
    {
        return a.x * b.x + a.y * b.y;
    }

    inline float len2(const Vec2 &v)
    {
        return dot(v, v);
    }

    inline float len(const Vec2 &v)
    {
        return std::sqrt(len2(v));
    }

    inline float clampf(const float x, const float a, const float b)
    {
        return std::max(a, std::min(b, x));
    }

    inline float lerpf(const float a, const float b, const float t)
    {
        return a + (b - a) * t;
    }

    inline Vec2 clampVec(const Vec2 &v, const float maxLen)
    {
        if (const float l = len(v); l > maxLen && l > 1e-6f)
            return v * (maxLen / l);
        return v;
    }

    // Axis-aligned tank extents, min inclusive / max inclusive.
    struct Bounds
    {
        Vec2 min{};
        Vec2 max{};

        [[nodiscard]] Vec2 clamp(const Vec2 &p) const
        {
            return {clampf(p.x, min.x, max.x), clampf(p.y, min.y, max.y)};
        }

        [[nodiscard]] float width() const
        {
            return max.x - min.x;
        }

        [[nodiscard]] float height() const
        {
            return max.y - min.y;
        }
    };
} // namespace aqua
