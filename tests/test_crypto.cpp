/**
 * @file test_crypto.cpp
 * @brief Тесты SHA256, Ed25519 и program derived addresses
 *
 * Векторы SHA256 из FIPS 180-2, Ed25519 из RFC 8032 (test 1).
 */

#include <gtest/gtest.h>

#include "crypto/keypair.hpp"
#include "crypto/pda.hpp"
#include "crypto/sha256.hpp"
#include "core/types.hpp"

#include <array>
#include <string>

namespace bundleminer::tests {

namespace {

template<std::size_t N>
std::array<uint8_t, N> from_hex(std::string_view hex) {
    std::array<uint8_t, N> out{};
    for (std::size_t i = 0; i < N; ++i) {
        out[i] = static_cast<uint8_t>(std::stoi(std::string(hex.substr(i * 2, 2)), nullptr, 16));
    }
    return out;
}

ByteSpan as_bytes(std::string_view text) {
    return ByteSpan{reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

constexpr std::string_view RFC8032_SEED =
    "9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60";
constexpr std::string_view RFC8032_PUBKEY =
    "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a";
constexpr std::string_view RFC8032_SIGNATURE =
    "e5564300c360ac729086e2cc806e828a84877f1eb8e5d974d873e065224901555fb8821590a33bacc61e39701cf9b46bd25bf5f0595bbe24655141438e7a100b";

} // namespace

// =============================================================================
// SHA256
// =============================================================================

/**
 * @brief Тест: пустое сообщение
 */
TEST(Sha256Test, EmptyMessage) {
    EXPECT_EQ(crypto::sha256(ByteSpan{}),
              from_hex<32>("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"));
}

/**
 * @brief Тест: "abc"
 */
TEST(Sha256Test, SimpleMessage) {
    EXPECT_EQ(crypto::sha256(as_bytes("abc")),
              from_hex<32>("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"));
}

/**
 * @brief Тест: инкрементальное вычисление совпадает с однократным
 */
TEST(Sha256Test, IncrementalMatchesOneShot) {
    const std::string message = "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq";

    crypto::Sha256 hasher;
    hasher.update(as_bytes(std::string_view(message).substr(0, 10)))
          .update(as_bytes(std::string_view(message).substr(10)));

    const auto expected =
        from_hex<32>("248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
    EXPECT_EQ(hasher.finalize(), expected);
    EXPECT_EQ(crypto::sha256(as_bytes(message)), expected);
}

// =============================================================================
// Ed25519
// =============================================================================

/**
 * @brief Тест: публичный ключ из seed
 */
TEST(KeypairTest, PublicKeyFromSeed) {
    auto keypair = crypto::Keypair::from_seed(from_hex<32>(RFC8032_SEED));

    ASSERT_TRUE(keypair.has_value()) << keypair.error().message;
    EXPECT_EQ(keypair->pubkey().bytes, from_hex<32>(RFC8032_PUBKEY));
}

/**
 * @brief Тест: подпись пустого сообщения
 */
TEST(KeypairTest, SignsEmptyMessage) {
    auto keypair = crypto::Keypair::from_seed(from_hex<32>(RFC8032_SEED));
    ASSERT_TRUE(keypair.has_value());

    auto signature = keypair->sign(ByteSpan{});

    ASSERT_TRUE(signature.has_value());
    EXPECT_EQ(signature->bytes, from_hex<64>(RFC8032_SIGNATURE));
    EXPECT_TRUE(crypto::Keypair::verify(keypair->pubkey(), ByteSpan{}, *signature));
}

/**
 * @brief Тест: изменённое сообщение не проходит проверку
 */
TEST(KeypairTest, VerifyRejectsTamperedMessage) {
    auto keypair = crypto::Keypair::from_seed(from_hex<32>(RFC8032_SEED));
    ASSERT_TRUE(keypair.has_value());

    auto signature = keypair->sign(as_bytes("mine"));
    ASSERT_TRUE(signature.has_value());

    EXPECT_TRUE(crypto::Keypair::verify(keypair->pubkey(), as_bytes("mine"), *signature));
    EXPECT_FALSE(crypto::Keypair::verify(keypair->pubkey(), as_bytes("mint"), *signature));
}

/**
 * @brief Тест: 64-байтный формат ключа (seed + pubkey)
 */
TEST(KeypairTest, FromBytes) {
    Bytes raw;
    const auto seed = from_hex<32>(RFC8032_SEED);
    const auto pubkey = from_hex<32>(RFC8032_PUBKEY);
    raw.insert(raw.end(), seed.begin(), seed.end());
    raw.insert(raw.end(), pubkey.begin(), pubkey.end());

    auto keypair = crypto::Keypair::from_bytes(raw);
    ASSERT_TRUE(keypair.has_value());
    EXPECT_EQ(keypair->pubkey().bytes, pubkey);

    raw.back() ^= 0x01;
    auto mismatch = crypto::Keypair::from_bytes(raw);
    ASSERT_FALSE(mismatch.has_value());
    EXPECT_EQ(mismatch.error().code, ErrorCode::CryptoInvalidKey);

    raw.pop_back();
    auto short_key = crypto::Keypair::from_bytes(raw);
    ASSERT_FALSE(short_key.has_value());
    EXPECT_EQ(short_key.error().code, ErrorCode::CryptoInvalidLength);
}

// =============================================================================
// Program derived addresses
// =============================================================================

/**
 * @brief Тест: публичный ключ Ed25519 лежит на кривой
 */
TEST(PdaTest, PublicKeyIsOnCurve) {
    ledger::Pubkey pubkey;
    pubkey.bytes = from_hex<32>(RFC8032_PUBKEY);

    EXPECT_TRUE(crypto::is_on_curve(pubkey));
}

/**
 * @brief Тест: найденный адрес детерминирован и вне кривой
 */
TEST(PdaTest, FindProgramAddress) {
    ledger::Pubkey program;
    program.bytes.fill(0x42);
    const std::array<ByteSpan, 1> seeds = {as_bytes("treasury")};

    auto first = crypto::find_program_address(seeds, program);
    auto second = crypto::find_program_address(seeds, program);

    ASSERT_TRUE(first.has_value()) << first.error().message;
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->first, second->first);
    EXPECT_EQ(first->second, second->second);
    EXPECT_FALSE(crypto::is_on_curve(first->first));

    // Повторное вычисление с найденным bump даёт тот же адрес
    const std::array<uint8_t, 1> bump = {first->second};
    const std::array<ByteSpan, 2> with_bump = {as_bytes("treasury"), ByteSpan{bump}};
    auto created = crypto::create_program_address(with_bump, program);
    ASSERT_TRUE(created.has_value());
    EXPECT_EQ(*created, first->first);
}

/**
 * @brief Тест: разные seed дают разные адреса
 */
TEST(PdaTest, SeedsChangeAddress) {
    ledger::Pubkey program;
    program.bytes.fill(0x42);
    const std::array<ByteSpan, 1> bus0 = {as_bytes("bus0")};
    const std::array<ByteSpan, 1> bus1 = {as_bytes("bus1")};

    auto a = crypto::find_program_address(bus0, program);
    auto b = crypto::find_program_address(bus1, program);

    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_NE(a->first, b->first);
}

/**
 * @brief Тест: слишком длинный seed
 */
TEST(PdaTest, RejectsLongSeed) {
    ledger::Pubkey program;
    const std::string long_seed(crypto::MAX_SEED_LEN + 1, 'x');
    const std::array<ByteSpan, 1> seeds = {as_bytes(long_seed)};

    EXPECT_FALSE(crypto::create_program_address(seeds, program).has_value());
}

} // namespace bundleminer::tests
