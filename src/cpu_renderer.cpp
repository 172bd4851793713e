#include "cpu_renderer.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

namespace scribble {

namespace {

constexpr f32 kEpsilon = 1e-6f;

Point add(Point a, Point b) { return {a.x + b.x, a.y + b.y}; }
Point sub(Point a, Point b) { return {a.x - b.x, a.y - b.y}; }
Point scale(Point a, f32 s) { return {a.x * s, a.y * s}; }
f32 cross(Point a, Point b) { return a.x * b.y - a.y * b.x; }
f32 dot(Point a, Point b) { return a.x * b.x + a.y * b.y; }
f32 length(Point a) { return std::sqrt(dot(a, a)); }

// Keeps far off-canvas coordinates inside i32 range.
i32 clampIndex(f32 v) {
    if (std::isnan(v)) return 0;
    return i32(std::clamp(v, -16777216.0f, 16777216.0f));
}

// Left-hand normal of a unit direction.
Point normalOf(Point d) { return {-d.y, d.x}; }

/**
 * Per-stroke coverage over a clamped pixel window. Shapes mark the pixels
 * whose centers they contain; the stroke is then blended once per marked
 * pixel.
 */
class CoverageMask {
public:
    CoverageMask(i32 x0, i32 y0, i32 x1, i32 y1)
        : x0_(x0), y0_(y0), w_(std::max(0, x1 - x0)), h_(std::max(0, y1 - y0)),
          bits_(size_t(w_) * size_t(h_), 0) {}

    bool empty() const { return w_ == 0 || h_ == 0; }

    void mark(i32 x, i32 y) {
        if (x < x0_ || y < y0_ || x >= x0_ + w_ || y >= y0_ + h_) return;
        bits_[size_t(y - y0_) * size_t(w_) + size_t(x - x0_)] = 1;
    }

    void fillDisk(Point c, f32 r) {
        i32 minX, minY, maxX, maxY;
        if (!clampBox(c.x - r, c.y - r, c.x + r, c.y + r, minX, minY, maxX, maxY)) return;
        f32 r2 = r * r;
        for (i32 y = minY; y < maxY; ++y) {
            f32 dy = f32(y) + 0.5f - c.y;
            for (i32 x = minX; x < maxX; ++x) {
                f32 dx = f32(x) + 0.5f - c.x;
                if (dx * dx + dy * dy <= r2) mark(x, y);
            }
        }
    }

    // Works for either winding; degenerate polygons cover nothing.
    void fillConvex(const Point* poly, i32 n) {
        f32 area = 0;
        f32 bx0 = poly[0].x, by0 = poly[0].y, bx1 = bx0, by1 = by0;
        for (i32 i = 0; i < n; ++i) {
            const Point& a = poly[i];
            const Point& b = poly[(i + 1) % n];
            area += cross(a, b);
            bx0 = std::min(bx0, a.x);
            by0 = std::min(by0, a.y);
            bx1 = std::max(bx1, a.x);
            by1 = std::max(by1, a.y);
        }
        if (std::fabs(area) < kEpsilon) return;

        i32 minX, minY, maxX, maxY;
        if (!clampBox(bx0, by0, bx1, by1, minX, minY, maxX, maxY)) return;

        for (i32 y = minY; y < maxY; ++y) {
            f32 py = f32(y) + 0.5f;
            for (i32 x = minX; x < maxX; ++x) {
                f32 px = f32(x) + 0.5f;
                bool pos = false, neg = false;
                for (i32 i = 0; i < n && !(pos && neg); ++i) {
                    const Point& a = poly[i];
                    const Point& b = poly[(i + 1) % n];
                    f32 side = (b.x - a.x) * (py - a.y) - (b.y - a.y) * (px - a.x);
                    if (side > kEpsilon) pos = true;
                    else if (side < -kEpsilon) neg = true;
                }
                if (!(pos && neg)) mark(x, y);
            }
        }
    }

    // Bresenham's line algorithm
    void hairline(Point p1, Point p2) {
        i32 x0 = clampIndex(std::floor(p1.x)), y0 = clampIndex(std::floor(p1.y));
        i32 x1 = clampIndex(std::floor(p2.x)), y1 = clampIndex(std::floor(p2.y));

        i32 dx = std::abs(x1 - x0), dy = std::abs(y1 - y0);
        i32 sx = x0 < x1 ? 1 : -1, sy = y0 < y1 ? 1 : -1;
        i32 err = dx - dy;

        while (true) {
            mark(x0, y0);
            if (x0 == x1 && y0 == y1) break;
            i32 e2 = 2 * err;
            if (e2 > -dy) { err -= dy; x0 += sx; }
            if (e2 < dx) { err += dx; y0 += sy; }
        }
    }

    template <typename Fn>
    void forEachCovered(Fn&& fn) const {
        for (i32 y = 0; y < h_; ++y) {
            const u8* row = bits_.data() + size_t(y) * size_t(w_);
            for (i32 x = 0; x < w_; ++x) {
                if (row[x]) fn(x0_ + x, y0_ + y);
            }
        }
    }

private:
    // Pixels whose centers may fall inside [fx0, fx1] x [fy0, fy1].
    bool clampBox(f32 fx0, f32 fy0, f32 fx1, f32 fy1,
                  i32& minX, i32& minY, i32& maxX, i32& maxY) const {
        minX = std::max(x0_, clampIndex(std::floor(fx0 - 0.5f)));
        minY = std::max(y0_, clampIndex(std::floor(fy0 - 0.5f)));
        maxX = std::min(x0_ + w_, clampIndex(std::ceil(fx1 + 0.5f)));
        maxY = std::min(y0_ + h_, clampIndex(std::ceil(fy1 + 0.5f)));
        return minX < maxX && minY < maxY;
    }

    i32 x0_, y0_, w_, h_;
    std::vector<u8> bits_;
};

void addCap(CoverageMask& mask, Point p, Point d, f32 hw, StrokeCap cap) {
    switch (cap) {
    case StrokeCap::Butt:
        break;
    case StrokeCap::Round:
        mask.fillDisk(p, hw);
        break;
    case StrokeCap::Square: {
        // d points away from the stroke.
        Point n = scale(normalOf(d), hw);
        Point ext = add(p, scale(d, hw));
        Point quad[4] = {add(p, n), add(ext, n), sub(ext, n), sub(p, n)};
        mask.fillConvex(quad, 4);
        break;
    }
    }
}

void addJoin(CoverageMask& mask, Point v, Point d0, Point d1, f32 hw,
             StrokeJoin join, f32 miterLimit) {
    if (join == StrokeJoin::Round) {
        mask.fillDisk(v, hw);
        return;
    }

    f32 turn = cross(d0, d1);
    if (std::fabs(turn) < kEpsilon && dot(d0, d1) > 0) return;

    // The gap opens on the side away from the turn.
    f32 side = turn > 0 ? -1.0f : 1.0f;
    Point n0 = normalOf(d0);
    Point n1 = normalOf(d1);
    Point a = add(v, scale(n0, hw * side));
    Point b = add(v, scale(n1, hw * side));

    if (join == StrokeJoin::Miter) {
        Point bisector = add(n0, n1);
        f32 len = length(bisector);
        f32 cosHalf = len * 0.5f;
        if (cosHalf > kEpsilon && 1.0f / cosHalf <= miterLimit) {
            Point tip = add(v, scale(bisector, side * hw / (cosHalf * len)));
            Point kite[4] = {v, a, tip, b};
            mask.fillConvex(kite, 4);
            return;
        }
    }

    Point bevel[3] = {v, a, b};
    mask.fillConvex(bevel, 3);
}

} // namespace

void CpuRenderer::visitFillRect(Rect r, Color c) {
    if (!target_ || !target_->valid()) return;

    i32 x0 = std::max(clampIndex(std::floor(r.x)), 0);
    i32 y0 = std::max(clampIndex(std::floor(r.y)), 0);
    i32 x1 = std::min(clampIndex(std::floor(r.x + r.w)), target_->width());
    i32 y1 = std::min(clampIndex(std::floor(r.y + r.h)), target_->height());

    for (i32 y = y0; y < y1; ++y) {
        for (i32 x = x0; x < x1; ++x) {
            blendPixel(x, y, c);
        }
    }
}

void CpuRenderer::visitStrokePath(const Point* pts, i32 count, const StrokeStyle& style) {
    if (!target_ || !target_->valid()) return;
    if (!pts || count <= 0 || style.width <= 0 || style.color.a == 0) return;

    // Consecutive duplicates carry no direction.
    std::vector<Point> verts;
    verts.reserve(size_t(count));
    verts.push_back(pts[0]);
    for (i32 i = 1; i < count; ++i) {
        if (length(sub(pts[i], verts.back())) > kEpsilon) verts.push_back(pts[i]);
    }

    f32 hw = style.width * 0.5f;
    f32 reach = hw * std::max(style.join == StrokeJoin::Miter ? style.miterLimit : 1.0f,
                              1.5f);

    f32 bx0 = verts[0].x, by0 = verts[0].y, bx1 = bx0, by1 = by0;
    for (const Point& p : verts) {
        bx0 = std::min(bx0, p.x);
        by0 = std::min(by0, p.y);
        bx1 = std::max(bx1, p.x);
        by1 = std::max(by1, p.y);
    }
    CoverageMask mask(std::max(0, clampIndex(std::floor(bx0 - reach)) - 1),
                      std::max(0, clampIndex(std::floor(by0 - reach)) - 1),
                      std::min(target_->width(), clampIndex(std::ceil(bx1 + reach)) + 1),
                      std::min(target_->height(), clampIndex(std::ceil(by1 + reach)) + 1));
    if (mask.empty()) return;

    if (style.width < 1.0f) {
        for (size_t i = 0; i + 1 < verts.size(); ++i) {
            mask.hairline(verts[i], verts[i + 1]);
        }
        if (verts.size() == 1) {
            mask.mark(clampIndex(std::floor(verts[0].x)), clampIndex(std::floor(verts[0].y)));
        }
    } else if (verts.size() == 1) {
        // A tap with no movement: a dot shaped by the cap.
        Point p = verts[0];
        if (style.cap == StrokeCap::Round) {
            mask.fillDisk(p, hw);
        } else if (style.cap == StrokeCap::Square) {
            Point square[4] = {{p.x - hw, p.y - hw}, {p.x + hw, p.y - hw},
                               {p.x + hw, p.y + hw}, {p.x - hw, p.y + hw}};
            mask.fillConvex(square, 4);
        }
    } else {
        std::vector<Point> dirs;
        dirs.reserve(verts.size() - 1);
        for (size_t i = 0; i + 1 < verts.size(); ++i) {
            Point d = sub(verts[i + 1], verts[i]);
            dirs.push_back(scale(d, 1.0f / length(d)));
        }

        for (size_t i = 0; i < dirs.size(); ++i) {
            Point n = scale(normalOf(dirs[i]), hw);
            Point body[4] = {add(verts[i], n), add(verts[i + 1], n),
                             sub(verts[i + 1], n), sub(verts[i], n)};
            mask.fillConvex(body, 4);
        }

        for (size_t i = 1; i < dirs.size(); ++i) {
            addJoin(mask, verts[i], dirs[i - 1], dirs[i], hw, style.join, style.miterLimit);
        }

        addCap(mask, verts.front(), scale(dirs.front(), -1.0f), hw, style.cap);
        addCap(mask, verts.back(), dirs.back(), hw, style.cap);
    }

    mask.forEachCovered([&](i32 x, i32 y) { blendPixel(x, y, style.color); });
}

void CpuRenderer::blendPixel(i32 x, i32 y, Color c) {
    if (!target_ || !target_->valid()) return;
    if (x < 0 || x >= target_->width() || y < 0 || y >= target_->height()) return;
    if (c.a == 0) return;

    u32* row = static_cast<u32*>(target_->rowAddr(y));
    u32& pixel = row[x];
    PixelFormat fmt = target_->format();

    if (c.a == 255) {
        pixel = PackColor(c, fmt);
        return;
    }

    Color dst = UnpackColor(pixel, fmt);
    u32 invA = 255 - c.a;
    Color out;
    out.r = u8((c.r * c.a + dst.r * invA) / 255);
    out.g = u8((c.g * c.a + dst.g * invA) / 255);
    out.b = u8((c.b * c.a + dst.b * invA) / 255);
    out.a = u8((c.a * 255 + dst.a * invA) / 255);
    pixel = PackColor(out, fmt);
}

} // namespace scribble
