#include "dk/export/ImageWriter.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"

namespace dk {

bool formatForPath(const std::string& path, ImageFormat& out) {
  auto dot = path.find_last_of('.');
  auto slash = path.find_last_of("/\\");
  if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
    out = ImageFormat::Png;
    return true;
  }
  std::string ext = path.substr(dot + 1);
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (ext == "png") out = ImageFormat::Png;
  else if (ext == "ppm") out = ImageFormat::Ppm;
  else if (ext == "jpg" || ext == "jpeg") out = ImageFormat::Jpeg;
  else if (ext == "bmp") out = ImageFormat::Bmp;
  else return false;
  return true;
}

// ---------------------------------------------------------------------------
// PPM
// ---------------------------------------------------------------------------

bool writePPM(const std::string& path, const Image& img) {
  if (img.empty()) return false;
  FILE* f = std::fopen(path.c_str(), "wb");
  if (!f) return false;

  std::fprintf(f, "P6\n%d %d\n255\n", img.width, img.height);
  std::vector<std::uint8_t> row(static_cast<std::size_t>(img.width) * 3);
  bool ok = true;
  for (int y = 0; y < img.height && ok; y++) {
    for (int x = 0; x < img.width; x++) {
      const std::uint8_t* p = img.at(x, y);
      row[static_cast<std::size_t>(x) * 3 + 0] = p[0];
      row[static_cast<std::size_t>(x) * 3 + 1] = p[1];
      row[static_cast<std::size_t>(x) * 3 + 2] = p[2];
    }
    ok = std::fwrite(row.data(), 1, row.size(), f) == row.size();
  }

  return std::fclose(f) == 0 && ok;
}

// ---------------------------------------------------------------------------
// JPEG / BMP (stb_image_write)
// ---------------------------------------------------------------------------

bool writeJPEG(const std::string& path, const Image& img, int quality) {
  if (img.empty()) return false;
  std::vector<std::uint8_t> rgb(static_cast<std::size_t>(img.width) * img.height * 3);
  std::size_t o = 0;
  for (int y = 0; y < img.height; y++) {
    for (int x = 0; x < img.width; x++) {
      const std::uint8_t* p = img.at(x, y);
      unsigned a = p[3];
      for (int c = 0; c < 3; c++) {
        rgb[o++] = static_cast<std::uint8_t>((p[c] * a + 255u * (255u - a) + 127u) / 255u);
      }
    }
  }
  return stbi_write_jpg(path.c_str(), img.width, img.height, 3, rgb.data(),
                        std::clamp(quality, 1, 100)) != 0;
}

bool writeBMP(const std::string& path, const Image& img) {
  if (img.empty()) return false;
  return stbi_write_bmp(path.c_str(), img.width, img.height, 4, img.pixels.data()) != 0;
}

// ---------------------------------------------------------------------------
// PNG (stored deflate, RGBA)
// ---------------------------------------------------------------------------

namespace {

// CRC32 lookup table (PNG uses ISO 3309 / ITU-T V.42 polynomial).
struct CrcTable {
  std::uint32_t t[256];
  CrcTable() {
    for (std::uint32_t n = 0; n < 256; n++) {
      std::uint32_t c = n;
      for (int k = 0; k < 8; k++) c = (c & 1) ? 0xEDB88320u ^ (c >> 1) : c >> 1;
      t[n] = c;
    }
  }
};

std::uint32_t crc32(const std::uint8_t* data, std::size_t len) {
  static const CrcTable table;
  std::uint32_t c = 0xFFFFFFFFu;
  for (std::size_t i = 0; i < len; i++) {
    c = table.t[(c ^ data[i]) & 0xFF] ^ (c >> 8);
  }
  return c ^ 0xFFFFFFFFu;
}

std::uint32_t adler32(const std::uint8_t* data, std::size_t len) {
  constexpr std::uint32_t MOD = 65521u;
  constexpr std::size_t NMAX = 5552; // max bytes before the sums can overflow
  std::uint32_t a = 1, b = 0;
  std::size_t offset = 0;
  while (offset < len) {
    std::size_t chunk = std::min(len - offset, NMAX);
    for (std::size_t i = 0; i < chunk; i++) {
      a += data[offset + i];
      b += a;
    }
    a %= MOD;
    b %= MOD;
    offset += chunk;
  }
  return (b << 16) | a;
}

void pushBE32(std::vector<std::uint8_t>& buf, std::uint32_t v) {
  buf.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFF));
  buf.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFF));
  buf.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
  buf.push_back(static_cast<std::uint8_t>(v & 0xFF));
}

void writeChunk(std::vector<std::uint8_t>& out, const char type[4],
                const std::vector<std::uint8_t>& data) {
  pushBE32(out, static_cast<std::uint32_t>(data.size()));
  std::size_t typeStart = out.size();
  out.insert(out.end(), type, type + 4);
  out.insert(out.end(), data.begin(), data.end());
  // CRC over type + data
  pushBE32(out, crc32(&out[typeStart], 4 + data.size()));
}

// One filter byte (None) per row, then RGBA.
std::vector<std::uint8_t> scanlines(const Image& img) {
  const std::size_t rowBytes = static_cast<std::size_t>(img.width) * 4;
  std::vector<std::uint8_t> raw;
  raw.reserve(static_cast<std::size_t>(img.height) * (rowBytes + 1));
  for (int y = 0; y < img.height; y++) {
    raw.push_back(0x00);
    const std::uint8_t* row = img.at(0, y);
    raw.insert(raw.end(), row, row + rowBytes);
  }
  return raw;
}

// zlib stream of stored (uncompressed) deflate blocks, RFC 1950/1951.
std::vector<std::uint8_t> zlibStored(const std::vector<std::uint8_t>& data) {
  constexpr std::size_t kMaxBlock = 65535;
  std::vector<std::uint8_t> z;
  z.reserve(2 + (data.size() / kMaxBlock + 1) * 5 + data.size() + 4);

  z.push_back(0x78); // CMF: deflate, 32K window
  z.push_back(0x01); // FLG: no dict, check bits

  std::size_t offset = 0;
  do {
    std::size_t blockLen = std::min(data.size() - offset, kMaxBlock);
    bool last = offset + blockLen == data.size();
    z.push_back(last ? 0x01 : 0x00); // BFINAL | BTYPE=00

    auto len16 = static_cast<std::uint16_t>(blockLen);
    auto nlen16 = static_cast<std::uint16_t>(~len16);
    z.push_back(static_cast<std::uint8_t>(len16 & 0xFF));
    z.push_back(static_cast<std::uint8_t>(len16 >> 8));
    z.push_back(static_cast<std::uint8_t>(nlen16 & 0xFF));
    z.push_back(static_cast<std::uint8_t>(nlen16 >> 8));

    z.insert(z.end(), data.begin() + static_cast<std::ptrdiff_t>(offset),
             data.begin() + static_cast<std::ptrdiff_t>(offset + blockLen));
    offset += blockLen;
  } while (offset < data.size());

  pushBE32(z, adler32(data.data(), data.size()));
  return z;
}

} // anonymous namespace

std::vector<std::uint8_t> encodePNG(const Image& img) {
  std::vector<std::uint8_t> out;
  if (img.empty()) return out;

  const std::uint8_t sig[8] = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};
  out.insert(out.end(), sig, sig + 8);

  std::vector<std::uint8_t> ihdr;
  pushBE32(ihdr, static_cast<std::uint32_t>(img.width));
  pushBE32(ihdr, static_cast<std::uint32_t>(img.height));
  ihdr.push_back(8);  // bit depth
  ihdr.push_back(6);  // color type: RGBA
  ihdr.push_back(0);  // compression: deflate
  ihdr.push_back(0);  // filter method: adaptive
  ihdr.push_back(0);  // interlace: none
  writeChunk(out, "IHDR", ihdr);

  writeChunk(out, "IDAT", zlibStored(scanlines(img)));
  writeChunk(out, "IEND", {});
  return out;
}

bool writePNG(const std::string& path, const Image& img) {
  std::vector<std::uint8_t> bytes = encodePNG(img);
  if (bytes.empty()) return false;
  FILE* f = std::fopen(path.c_str(), "wb");
  if (!f) return false;
  std::size_t written = std::fwrite(bytes.data(), 1, bytes.size(), f);
  return std::fclose(f) == 0 && written == bytes.size();
}

Status saveImage(const std::string& path, const Image& img) {
  ImageFormat fmt;
  if (!formatForPath(path, fmt)) {
    std::fprintf(stderr, "ImageWriter: unsupported output format '%s'\n", path.c_str());
    return ioError("UNSUPPORTED_FORMAT",
                   "Unsupported image format (use .png, .ppm, .jpg, .jpeg or .bmp): " + path,
                   "{\"path\":" + jsonQuote(path) + "}");
  }
  bool ok = false;
  switch (fmt) {
    case ImageFormat::Png:  ok = writePNG(path, img); break;
    case ImageFormat::Ppm:  ok = writePPM(path, img); break;
    case ImageFormat::Jpeg: ok = writeJPEG(path, img); break;
    case ImageFormat::Bmp:  ok = writeBMP(path, img); break;
  }
  if (!ok) {
    std::fprintf(stderr, "ImageWriter: failed to write '%s'\n", path.c_str());
    return ioError("WRITE_FAILED", "Cannot write image: " + path,
                   "{\"path\":" + jsonQuote(path) + "}");
  }
  return {};
}

} // namespace dk
