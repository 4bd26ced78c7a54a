#include "common/minimizer.hpp"

#include <algorithm>
#include <cmath>

namespace formation {

namespace {

constexpr double kGolden = 0.381966011250105; // (3 - sqrt(5)) / 2

struct LineMin {
  double t{0.0};
  double value{std::numeric_limits<double>::infinity()};
};

// [a, b] 上的黄金分割搜索；区间端点也参与比较，边界最优解可以精确取到
template <class Fn>
LineMin GoldenSection(Fn&& g, double a, double b, const MinimizerOptions& opt) {
  LineMin best;
  auto consider = [&best](double t, double v) {
    if (std::isfinite(v) && v < best.value) {
      best.t = t;
      best.value = v;
    }
  };

  consider(a, g(a));
  if (b - a <= opt.line_tolerance) {
    return best;
  }
  consider(b, g(b));

  double x1 = a + kGolden * (b - a);
  double x2 = b - kGolden * (b - a);
  double f1 = g(x1);
  double f2 = g(x2);

  for (int it = 0; it < opt.max_line_iterations; ++it) {
    if (f1 < f2) {
      b = x2;
      x2 = x1;
      f2 = f1;
      x1 = a + kGolden * (b - a);
      f1 = g(x1);
    } else {
      a = x1;
      x1 = x2;
      f1 = f2;
      x2 = b - kGolden * (b - a);
      f2 = g(x2);
    }
    if (b - a < opt.line_tolerance) break;
  }

  consider(x1, f1);
  consider(x2, f2);
  return best;
}

} // namespace

MinimizerResult MinimizeOrderedPair(const PairObjective& f,
                                    const OrderedPairBounds& bounds,
                                    double first0, double second0,
                                    const MinimizerOptions& options) {
  MinimizerResult out;
  if (!f || !(bounds.upper - bounds.lower >= bounds.min_gap) || bounds.min_gap < 0.0) {
    return out; // 可行域为空
  }

  // 初值投影到可行域
  double e = std::clamp(first0, bounds.lower, bounds.upper - bounds.min_gap);
  double x = std::clamp(second0, e + bounds.min_gap, bounds.upper);
  double fx = f(e, x);
  if (!std::isfinite(fx)) {
    return out;
  }

  for (int sweep = 1; sweep <= options.max_sweeps; ++sweep) {
    const double before = fx;

    // 1) 沿 first
    {
      const LineMin lm = GoldenSection([&](double t) { return f(t, x); },
                                       bounds.lower, x - bounds.min_gap, options);
      if (lm.value < fx) { e = lm.t; fx = lm.value; }
    }
    // 2) 沿 second
    {
      const LineMin lm = GoldenSection([&](double t) { return f(e, t); },
                                       e + bounds.min_gap, bounds.upper, options);
      if (lm.value < fx) { x = lm.t; fx = lm.value; }
    }
    // 3) 整体平移
    {
      const double e0 = e, x0 = x;
      const LineMin lm = GoldenSection([&](double s) { return f(e0 + s, x0 + s); },
                                       bounds.lower - e0, bounds.upper - x0, options);
      if (lm.value < fx) {
        e = std::clamp(e0 + lm.t, bounds.lower, bounds.upper - bounds.min_gap);
        x = std::clamp(x0 + lm.t, e + bounds.min_gap, bounds.upper);
        fx = f(e, x);
      }
    }

    out.sweeps = sweep;
    if (!std::isfinite(fx)) {
      return out;
    }
    if (before - fx <= options.tolerance) {
      out.converged = true;
      break;
    }
  }

  out.first = e;
  out.second = x;
  out.value = fx;
  return out;
}

} // namespace formation
