/**
 * SMiner - SHA-256 Helper Unit Tests
 *
 * Verifies header hashing, midstates and pdiff targets against known vectors.
 */

#include "TestSupport.h"
#include "crypto/Sha256.h"
#include <iomanip>

using namespace sminer;

namespace {

std::string reversedHex(const Hash256& hash) {
    Hash256 rev;
    std::reverse_copy(hash.begin(), hash.end(), rev.begin());
    return toHex(rev);
}

Hash256 targetWith(std::initializer_list<std::pair<int, uint8_t>> bytes) {
    Hash256 target{};
    for (const auto& [index, value] : bytes) {
        target[index] = value;
    }
    return target;
}

}  // namespace

int main() {
    test::Results results;

    std::cout << "=== Header Hashing Tests ===" << std::endl << std::endl;

    const HeaderData& header = ValidationJob::defaultHeader();
    const Nonce nonce = 0x5eb01f04;

    Hash256 hash = hashHeader(header, nonce);
    results.check(reversedHex(hash) ==
                  "000000007045d519b0918f8473131d5d377e8688bd26c6a7c415db3158d81d9f",
                  "validation header hash");
    results.check(isDifficultyOne(hash), "validation nonce is a difficulty-1 share");
    results.check(!isDifficultyOne(hashHeader(header, nonce + 1)), "neighbouring nonce is not a share");

    HeaderData serialized = getworkToHeader(header);
    results.check(serialized[0] == 0x01 && serialized[3] == 0x00, "getwork words are byte-swapped");
    results.check(headerToGetwork(serialized.data()) == header, "getwork conversion round trip");

    Midstate midstate = computeMidstate(serialized.data());
    results.check(toHex(midstate) ==
                  "011732df67dd16de9a6f59cdd355dd6e44325e232aa70e7af23924db41aa505f",
                  "midstate of validation header");

    MidstateHasher hasher(midstate, serialized.data() + 64);
    results.check(hasher.hash(nonce) == hash, "midstate hasher matches full hash");
    results.check(hasher.isShare(nonce), "midstate hasher finds the share");
    results.check(hasher.hash(12345) == hashHeader(header, 12345), "midstate hasher on other nonce");

    Bytes abc = {'a', 'b', 'c'};
    results.check(toHex(sha256(abc.data(), abc.size())) ==
                  "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
                  "sha256(\"abc\")");

    std::cout << std::endl << "=== pdiff Target Calculation Tests ===" << std::endl << std::endl;

    Hash256 target;

    // 0x00000000FFFF0000...00
    difficultyToTarget(1.0, target);
    results.check(target == targetWith({{4, 0xFF}, {5, 0xFF}}), "difficulty = 1");

    // 0xFFFF / 2 = 0x7FFF remainder 1, 1 * 256 / 2 = 0x80
    difficultyToTarget(2.0, target);
    results.check(target == targetWith({{4, 0x7F}, {5, 0xFF}, {6, 0x80}}), "difficulty = 2");

    difficultyToTarget(256.0, target);
    results.check(target == targetWith({{5, 0xFF}, {6, 0xFF}}), "difficulty = 256");

    difficultyToTarget(65536.0, target);
    results.check(target == targetWith({{6, 0xFF}, {7, 0xFF}}), "difficulty = 65536");

    // 0xFFFF / 1.5 = 0xAAAA exactly
    difficultyToTarget(1.5, target);
    results.check(target == targetWith({{4, 0xAA}, {5, 0xAA}}), "difficulty = 1.5");

    std::cout << std::endl << "=== Target Comparison Tests ===" << std::endl << std::endl;

    difficultyToTarget(1.0, target);
    results.check(meetsTarget(hash, target), "validation share meets difficulty 1");

    Hash256 high{};
    high[27] = 0x01;    // 0x0000000001...
    results.check(meetsTarget(high, target), "hash below target accepted");

    difficultyToTarget(256.0, target);
    results.check(!meetsTarget(high, target), "hash above target rejected");

    results.check(meetsTarget(Hash256{}, target), "zero hash meets any target");

    return results.finish();
}
