#pragma once

#include <iterator>
#include <vector>

// Minimal animated GIF: 1x1 pixel, two-colour global table, frame_count frames
inline std::vector<unsigned char> makeTinyGif(int frame_count)
{
    std::vector<unsigned char> gif = {
        'G', 'I', 'F', '8', '9', 'a',
        0x01, 0x00, 0x01, 0x00, // logical screen 1x1
        0x80, 0x00, 0x00,       // global colour table, 2 entries
        0x00, 0x00, 0x00,       // black
        0xFF, 0xFF, 0xFF};      // white

    for (int i = 0; i < frame_count; ++i)
    {
        // Graphic control extension: keep previous frame, 10cs delay
        const unsigned char gce[] = {0x21, 0xF9, 0x04, 0x04, 0x0A, 0x00, 0x00, 0x00};
        // Image descriptor at (0,0) 1x1, LZW min code size 2, one data sub-block
        const unsigned char frame[] = {0x2C, 0x00, 0x00, 0x00, 0x00, 0x01, 0x00, 0x01, 0x00, 0x00,
                                       0x02, 0x02, 0x44, 0x01, 0x00};
        gif.insert(gif.end(), std::begin(gce), std::end(gce));
        gif.insert(gif.end(), std::begin(frame), std::end(frame));
    }
    gif.push_back(0x3B);
    return gif;
}
