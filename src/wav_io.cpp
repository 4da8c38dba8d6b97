#include "wav_io.h"
#include <algorithm>
#include <cstring>
#include <fstream>

namespace optidex {

namespace {

void put_u16(std::ofstream& file, uint16_t v) {
    char b[2] = {static_cast<char>(v & 0xff), static_cast<char>((v >> 8) & 0xff)};
    file.write(b, 2);
}

void put_u32(std::ofstream& file, uint32_t v) {
    char b[4] = {static_cast<char>(v & 0xff), static_cast<char>((v >> 8) & 0xff),
                 static_cast<char>((v >> 16) & 0xff), static_cast<char>((v >> 24) & 0xff)};
    file.write(b, 4);
}

uint16_t get_u16(const char* p) {
    return static_cast<uint16_t>(static_cast<uint8_t>(p[0]) |
                                 (static_cast<uint8_t>(p[1]) << 8));
}

uint32_t get_u32(const char* p) {
    return static_cast<uint32_t>(static_cast<uint8_t>(p[0])) |
           (static_cast<uint32_t>(static_cast<uint8_t>(p[1])) << 8) |
           (static_cast<uint32_t>(static_cast<uint8_t>(p[2])) << 16) |
           (static_cast<uint32_t>(static_cast<uint8_t>(p[3])) << 24);
}

} // namespace

VoidResult write_wav(const std::string& path, const AudioBuffer& samples, int sample_rate) {
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return make_io_error("Cannot open for writing: " + path);
    }

    const uint16_t channels = 1;
    const uint16_t bits_per_sample = 16;
    uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(Sample));

    // RIFF header
    file.write("RIFF", 4);
    put_u32(file, 36 + data_size);
    file.write("WAVE", 4);

    // fmt chunk
    file.write("fmt ", 4);
    put_u32(file, 16);
    put_u16(file, 1);  // PCM
    put_u16(file, channels);
    put_u32(file, static_cast<uint32_t>(sample_rate));
    put_u32(file, static_cast<uint32_t>(sample_rate) * channels * bits_per_sample / 8);
    put_u16(file, channels * bits_per_sample / 8);
    put_u16(file, bits_per_sample);

    // data chunk
    file.write("data", 4);
    put_u32(file, data_size);
    file.write(reinterpret_cast<const char*>(samples.data()), data_size);

    if (!file.good()) {
        return make_io_error("Write failed: " + path);
    }
    return VoidResult();
}

Result<WavData> read_wav(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return make_io_error("Cannot open WAV file: " + path);
    }

    char riff[12];
    file.read(riff, 12);
    if (file.gcount() < 12 || std::memcmp(riff, "RIFF", 4) != 0 || std::memcmp(riff + 8, "WAVE", 4) != 0) {
        return make_parse_error("Not a RIFF/WAVE file: " + path);
    }

    int channels = 0;
    int sample_rate = 0;
    int bits = 0;
    bool have_fmt = false;

    char chunk[8];
    while (file.read(chunk, 8)) {
        uint32_t size = get_u32(chunk + 4);

        if (std::memcmp(chunk, "fmt ", 4) == 0) {
            std::string fmt(size, '\0');
            file.read(&fmt[0], size);
            if (size < 16 || static_cast<uint32_t>(file.gcount()) < size) {
                return make_parse_error("Truncated fmt chunk: " + path);
            }
            channels = get_u16(fmt.data() + 2);
            sample_rate = static_cast<int>(get_u32(fmt.data() + 4));
            bits = get_u16(fmt.data() + 14);
            have_fmt = true;
        } else if (std::memcmp(chunk, "data", 4) == 0) {
            if (!have_fmt) {
                return make_parse_error("data chunk before fmt: " + path);
            }
            if (bits != 16 || channels < 1) {
                return make_parse_error("Unsupported WAV format (" + std::to_string(bits) +
                                        " bit, " + std::to_string(channels) + " ch): " + path);
            }

            AudioBuffer raw(size / sizeof(Sample));
            file.read(reinterpret_cast<char*>(raw.data()), raw.size() * sizeof(Sample));
            raw.resize(static_cast<size_t>(file.gcount()) / sizeof(Sample));

            WavData wav;
            wav.sample_rate = sample_rate;
            if (channels == 1) {
                wav.samples = std::move(raw);
            } else {
                wav.samples.reserve(raw.size() / channels);
                for (size_t i = 0; i + channels <= raw.size(); i += channels) {
                    wav.samples.push_back(raw[i]);
                }
            }
            return wav;
        } else {
            // Chunks are word aligned
            file.seekg(size + (size & 1), std::ios::cur);
        }
    }

    return make_parse_error("No data chunk: " + path);
}

AudioBuffer resample(const AudioBuffer& input, int from_rate, int to_rate) {
    if (from_rate == to_rate || input.empty() || from_rate <= 0 || to_rate <= 0) return input;

    double ratio = static_cast<double>(from_rate) / static_cast<double>(to_rate);
    size_t output_samples = static_cast<size_t>(input.size() / ratio);

    AudioBuffer output;
    output.reserve(output_samples);

    for (size_t i = 0; i < output_samples; i++) {
        double input_pos = static_cast<double>(i) * ratio;
        size_t idx0 = static_cast<size_t>(input_pos);
        if (idx0 >= input.size()) break;
        size_t idx1 = std::min(idx0 + 1, input.size() - 1);

        double t = input_pos - static_cast<double>(idx0);
        double interpolated = input[idx0] * (1.0 - t) + input[idx1] * t;
        output.push_back(static_cast<Sample>(interpolated));
    }

    return output;
}

} // namespace optidex
