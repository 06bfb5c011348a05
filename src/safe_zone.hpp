#pragma once

struct SafeZone {
    int x      = 0;
    int y      = 0;
    int width  = 0;
    int height = 0;

    bool empty() const { return width <= 0 || height <= 0; }
};

// Centered square spanning a quarter of the QR's side (1/16 of its area),
// small enough for QR error correction to recover the covered modules.
// size=512 -> (192, 192, 128, 128)
inline SafeZone safe_zone_for(int size)
{
    if (size <= 0) return SafeZone{};
    const int side = size / 4;
    return SafeZone{(size - side) / 2, (size - side) / 2, side, side};
}
