#include "Waveform.h"
#include <cmath>

double waveform::triangle_period(double amplitude, double ramp_rate) {
    return 4.0 * amplitude / ramp_rate;
}

double waveform::delta_at(double t, double amplitude, double ramp_rate, WaveDirection_E direction) {
    const double period = triangle_period(amplitude, ramp_rate);
    const double quarter = period / 4.0;
    const double offset = (direction == WaveDirection_CoolFirst) ? period / 2.0 : 0.0;

    // position within the current period, wrapped into [0, P)
    double u = std::fmod(t + offset, period);
    if (u < 0.0) {
        u += period;
    }

    if (u < quarter) {
        return amplitude * (u / quarter);                  // rising 0 -> +A
    }
    if (u < 3.0 * quarter) {
        return amplitude * ((2.0 * quarter - u) / quarter); // falling +A -> -A
    }
    return amplitude * ((u - 4.0 * quarter) / quarter);    // rising -A -> 0
}

std::vector<double> waveform::delta_series(const std::vector<double>& times,
                                           double amplitude, double ramp_rate,
                                           WaveDirection_E direction) {
    std::vector<double> out;
    out.reserve(times.size());
    for (double t : times) {
        out.push_back(delta_at(t, amplitude, ramp_rate, direction));
    }
    return out;
}

std::vector<double> waveform::time_grid(double duration_s, double update_hz) {
    std::vector<double> grid;
    if (duration_s <= 0.0 || update_hz <= 0.0) {
        return grid;
    }
    const long n = std::lround(duration_s * update_hz);
    grid.reserve(static_cast<std::size_t>(n));
    for (long i = 0; i < n; ++i) {
        grid.push_back(static_cast<double>(i) / update_hz);
    }
    return grid;
}
