#pragma once
#include "drive_types.hpp"

// forward/turn -> 좌/우 출력.
// raw = (f + t, f - t), 둘 중 큰 절댓값이 1을 넘으면 두 값을 같은 비율로 나눔
SideOutputs arcade_drive(double forward, double turn);
