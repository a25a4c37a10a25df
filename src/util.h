#pragma once
#include <optional>
#include <string>
#include <vector>

float midiToHz(int midi);

// RMS of a block, used for the input meters
float rms(const float* x, int n);

// RMS of one channel inside an interleaved block
float rmsInterleaved(const float* x, int frames, int channels, int channel);

struct SampleFileInfo {
  int sampleRate = 0;
  int channels = 0;
  long long frames = 0;
};

// Reads an encoded sample back as interleaved floats (tests and diagnostics).
bool readSampleFile(const std::string& path, SampleFileInfo& info, std::vector<float>& out);

// JSON numbers arrive as doubles. These return the exact integer, or nullopt for fractions,
// NaN and anything outside the target range.
std::optional<int> exactInt(double value);
// Request ids are echoed back as JSON numbers, so they must stay within [0, 2^53].
std::optional<long long> exactRequestId(double value);
