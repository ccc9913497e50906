#include <stdio.h>
#include <fstream>
#include <vector>
#include "image_write.h"
#include "color.h"

#define BMP_FILE_HEADER_SIZE 14
#define BMP_INFO_HEADER_SIZE 40
#define BMP_PIXEL_DATA_OFFSET (BMP_FILE_HEADER_SIZE + BMP_INFO_HEADER_SIZE)

static void PutU16(std::vector<char> &buffer, Uint16 value)
{
    buffer.push_back(char(value & 0xff));
    buffer.push_back(char((value >> 8) & 0xff));
}

static void PutU32(std::vector<char> &buffer, Uint32 value)
{
    buffer.push_back(char(value & 0xff));
    buffer.push_back(char((value >> 8) & 0xff));
    buffer.push_back(char((value >> 16) & 0xff));
    buffer.push_back(char((value >> 24) & 0xff));
}

static bool CheckPixels(const Uint32 *pixels, Uint32 width, Uint32 height)
{
    if (pixels == NULL && width != 0 && height != 0)
    {
        printf("Cannot encode a %ux%u image without pixels\n", width, height);
        return false;
    }
    return true;
}

bool ImageWrite::WritePPMToStream(const Uint32 *pixels, Uint32 width, Uint32 height, std::ostream &out)
{
    if (!CheckPixels(pixels, width, height))
        return false;

    out << "P6\n" << width << " " << height << "\n255\n";

    std::vector<char> row(size_t(width) * 3);
    for (Uint32 y = 0; y < height; ++y)
    {
        const Uint32 *src = pixels + size_t(y) * width;
        for (Uint32 x = 0; x < width; ++x)
        {
            Color c = UtilColor::Unpack(src[x]);
            row[x * 3 + 0] = char(c.r);
            row[x * 3 + 1] = char(c.g);
            row[x * 3 + 2] = char(c.b);
        }
        out.write(row.data(), std::streamsize(row.size()));
    }

    if (!out)
    {
        printf("Failed writing PPM data\n");
        return false;
    }
    return true;
}

bool ImageWrite::WriteBMPToStream(const Uint32 *pixels, Uint32 width, Uint32 height, std::ostream &out)
{
    if (!CheckPixels(pixels, width, height))
        return false;

    // Width and height are stored as signed 32-bit values, the image size as unsigned
    Uint64 rowBytes = Uint64(width) * 3;
    Uint64 padding = (4 - (rowBytes % 4)) % 4;
    Uint64 imageSize = (rowBytes + padding) * height;
    if (width > 0x7fffffffu || height > 0x7fffffffu || imageSize + BMP_PIXEL_DATA_OFFSET > 0xffffffffu)
    {
        printf("Image of %ux%u is too large for BMP\n", width, height);
        return false;
    }

    std::vector<char> header;
    header.reserve(BMP_PIXEL_DATA_OFFSET);
    header.push_back('B');
    header.push_back('M');
    PutU32(header, Uint32(BMP_PIXEL_DATA_OFFSET + imageSize));  // file size
    PutU16(header, 0);                                           // reserved
    PutU16(header, 0);                                           // reserved
    PutU32(header, BMP_PIXEL_DATA_OFFSET);

    PutU32(header, BMP_INFO_HEADER_SIZE);
    PutU32(header, width);
    PutU32(header, Uint32(-Sint32(height)));                     // negative height => top-down
    PutU16(header, 1);                                           // planes
    PutU16(header, 24);                                          // bits per pixel
    PutU32(header, 0);                                           // BI_RGB
    PutU32(header, Uint32(imageSize));
    PutU32(header, 0);                                           // x pixels per meter
    PutU32(header, 0);                                           // y pixels per meter
    PutU32(header, 0);                                           // colors used
    PutU32(header, 0);                                           // important colors
    out.write(header.data(), std::streamsize(header.size()));

    std::vector<char> row(size_t(rowBytes + padding), 0);
    for (Uint32 y = 0; y < height; ++y)
    {
        const Uint32 *src = pixels + size_t(y) * width;
        for (Uint32 x = 0; x < width; ++x)
        {
            Color c = UtilColor::Unpack(src[x]);
            row[x * 3 + 0] = char(c.b);
            row[x * 3 + 1] = char(c.g);
            row[x * 3 + 2] = char(c.r);
        }
        out.write(row.data(), std::streamsize(row.size()));
    }

    if (!out)
    {
        printf("Failed writing BMP data\n");
        return false;
    }
    return true;
}

bool ImageWrite::WritePPM(const Surface *surface, const char *path)
{
    std::ofstream file(path, std::ios::out | std::ios::binary);
    if (!file)
    {
        printf("Could not open %s for writing\n", path);
        return false;
    }
    return WritePPMToStream(surface->pixels, surface->width, surface->height, file);
}

bool ImageWrite::WriteBMP(const Surface *surface, const char *path)
{
    std::ofstream file(path, std::ios::out | std::ios::binary);
    if (!file)
    {
        printf("Could not open %s for writing\n", path);
        return false;
    }
    return WriteBMPToStream(surface->pixels, surface->width, surface->height, file);
}
