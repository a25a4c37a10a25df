#include "util.h"
#include <cmath>
#include <sndfile.h>
#include <algorithm>
#include <limits>

float midiToHz(int midi) {
  return 440.0f * std::pow(2.0f, (float(midi) - 69.0f) / 12.0f);
}

float rms(const float* x, int n) {
  if (!x || n <= 0) return 0.f;
  double s = 0.0;
  for (int i = 0; i < n; ++i) s += double(x[i]) * double(x[i]);
  return float(std::sqrt(s / std::max(1, n)));
}

float rmsInterleaved(const float* x, int frames, int channels, int channel) {
  if (!x || frames <= 0 || channels <= 0 || channel < 0 || channel >= channels) return 0.f;
  double s = 0.0;
  for (int i = 0; i < frames; ++i) {
    const double v = x[size_t(i) * size_t(channels) + size_t(channel)];
    s += v * v;
  }
  return float(std::sqrt(s / frames));
}

bool readSampleFile(const std::string& path, SampleFileInfo& info, std::vector<float>& out) {
  SF_INFO sfinfo{};
  SNDFILE* sf = sf_open(path.c_str(), SFM_READ, &sfinfo);
  if (!sf) return false;
  info.sampleRate = sfinfo.samplerate;
  info.channels = sfinfo.channels;
  out.resize(size_t(sfinfo.frames) * size_t(sfinfo.channels));
  info.frames = sf_readf_float(sf, out.data(), sfinfo.frames);
  sf_close(sf);
  out.resize(size_t(info.frames) * size_t(info.channels));
  return info.frames > 0;
}

std::optional<int> exactInt(double value) {
  if (!std::isfinite(value)) return std::nullopt;
  if (value < double(std::numeric_limits<int>::min()) || value > double(std::numeric_limits<int>::max()))
    return std::nullopt;
  const int whole = static_cast<int>(value);
  if (double(whole) != value) return std::nullopt;
  return whole;
}

std::optional<long long> exactRequestId(double value) {
  constexpr double kLargestExact = 9007199254740992.0;   // 2^53
  if (!std::isfinite(value) || value < 0.0 || value > kLargestExact) return std::nullopt;
  const auto whole = static_cast<long long>(value);
  if (double(whole) != value) return std::nullopt;
  return whole;
}
