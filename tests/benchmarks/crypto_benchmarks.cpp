#include <benchmark/benchmark.h>
#include "lanshare/crypto/encryption.hpp"
#include "lanshare/crypto/key_derivation.hpp"
#include "lanshare/crypto/random.hpp"
#include "lanshare/network/frame_codec.hpp"
#include "support/crypto_helpers.hpp"
#include <algorithm>
#include <span>
#include <string>
#include <vector>

using namespace lanshare::crypto;
using namespace lanshare::network;

class CryptoBenchmarkFixture : public benchmark::Fixture {
public:
    void SetUp(const ::benchmark::State& /*state*/) override {
        key_ = SessionKey(lanshare::test::random_key());
    }

protected:
    std::vector<std::uint8_t> make_payload(std::size_t size) {
        return lanshare::test::random_bytes(size);
    }

    EncryptionEngine encryption_;
    SessionKey key_;
};

// One pairing-code derivation at the production iteration count
static void KeyDerivation_PairingCode(benchmark::State& state) {
    for (auto _ : state) {
        benchmark::DoNotOptimize(KeyDerivation::derive_session_key("482913"));
    }
}
BENCHMARK(KeyDerivation_PairingCode)->Unit(benchmark::kMillisecond);

BENCHMARK_DEFINE_F(CryptoBenchmarkFixture, Seal)(benchmark::State& state) {
    auto plaintext = make_payload(static_cast<std::size_t>(state.range(0)));
    std::vector<std::uint8_t> sealed;

    for (auto _ : state) {
        benchmark::DoNotOptimize(encryption_.seal(plaintext, key_, sealed));
    }
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK_REGISTER_F(CryptoBenchmarkFixture, Seal)->Arg(1024)->Arg(64 * 1024)->Arg(1024 * 1024);

BENCHMARK_DEFINE_F(CryptoBenchmarkFixture, Open)(benchmark::State& state) {
    auto plaintext = make_payload(static_cast<std::size_t>(state.range(0)));
    std::vector<std::uint8_t> sealed;
    if (!encryption_.seal(plaintext, key_, sealed)) {
        state.SkipWithError("seal failed");
        return;
    }

    std::vector<std::uint8_t> opened;
    for (auto _ : state) {
        benchmark::DoNotOptimize(encryption_.open(sealed, key_, opened));
    }
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK_REGISTER_F(CryptoBenchmarkFixture, Open)->Arg(1024)->Arg(64 * 1024)->Arg(1024 * 1024);

BENCHMARK_DEFINE_F(CryptoBenchmarkFixture, EncodeDataPacket)(benchmark::State& state) {
    FileDataMessage data;
    data.chunk = make_payload(static_cast<std::size_t>(state.range(0)));
    auto packet = Packet::make(PacketType::FILE_DATA, "0b7e7f4e-2f57-4d1a-9a8c-5b1f2e3d4c5b", data);

    for (auto _ : state) {
        benchmark::DoNotOptimize(encode_packet(packet, &key_, encryption_));
    }
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK_REGISTER_F(CryptoBenchmarkFixture, EncodeDataPacket)->Arg(64 * 1024);

// Frames split into network-sized reads before reassembly and decryption
BENCHMARK_DEFINE_F(CryptoBenchmarkFixture, DecodeDataStream)(benchmark::State& state) {
    FileDataMessage data;
    data.chunk = make_payload(64 * 1024);
    auto packet = Packet::make(PacketType::FILE_DATA, "0b7e7f4e-2f57-4d1a-9a8c-5b1f2e3d4c5b", data);

    std::vector<std::uint8_t> stream;
    for (int i = 0; i < 16; ++i) {
        auto frame = encode_packet(packet, &key_, encryption_);
        stream.insert(stream.end(), frame.begin(), frame.end());
    }

    const auto read_size = static_cast<std::size_t>(state.range(0));
    for (auto _ : state) {
        FrameDecoder decoder;
        std::span<const std::uint8_t> bytes(stream);
        std::size_t decoded = 0;

        for (std::size_t offset = 0; offset < bytes.size(); offset += read_size) {
            auto frames = decoder.feed(bytes.subspan(offset, std::min(read_size, bytes.size() - offset)));
            for (const auto& frame : frames) {
                benchmark::DoNotOptimize(decode_packet(frame, &key_, encryption_));
                ++decoded;
            }
        }
        benchmark::DoNotOptimize(decoded);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<std::int64_t>(stream.size()));
}
BENCHMARK_REGISTER_F(CryptoBenchmarkFixture, DecodeDataStream)->Arg(1500)->Arg(16 * 1024);

static void RandomGeneration_PairingCode(benchmark::State& state) {
    for (auto _ : state) {
        benchmark::DoNotOptimize(SecureRandom::generate_pairing_code());
    }
}
BENCHMARK(RandomGeneration_PairingCode);

static void RandomGeneration_SessionId(benchmark::State& state) {
    for (auto _ : state) {
        benchmark::DoNotOptimize(SecureRandom::generate_session_id());
    }
}
BENCHMARK(RandomGeneration_SessionId);

BENCHMARK_MAIN();
