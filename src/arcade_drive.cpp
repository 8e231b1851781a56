#include "arcade_drive.hpp"
#include <algorithm>
#include <cmath>

SideOutputs arcade_drive(double forward, double turn) {
    SideOutputs out{};
    out.left  = forward + turn;
    out.right = forward - turn;

    const double max_mag = std::max(std::abs(out.left), std::abs(out.right));
    if (max_mag > 1.0) {
        out.left  /= max_mag;
        out.right /= max_mag;
    }
    return out;
}
