#include "SEBM.hpp"

namespace SEBM {

std::vector<double> Trajectory::temperatures() const {
    std::vector<double> result;
    result.reserve(states.size());
    for (const auto& s : states) {
        result.push_back(s.temperature);
    }
    return result;
}

std::vector<double> Trajectory::albedos() const {
    std::vector<double> result;
    result.reserve(states.size());
    for (const auto& s : states) {
        result.push_back(s.albedo);
    }
    return result;
}

std::vector<double> linspace(double start, double end, int num) {
    std::vector<double> points;
    if (num <= 0) return points;
    if (num == 1) {
        points.push_back(start);
        return points;
    }

    points.resize(num);
    const double step = (end - start) / (num - 1);
    for (int i = 0; i < num; ++i) {
        points[i] = start + i * step;
    }
    // Pin the endpoint against accumulated rounding
    points[num - 1] = end;
    return points;
}

} // namespace SEBM
