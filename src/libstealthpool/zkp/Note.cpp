#include <libstealthpool/zkp/Note.h>

#include <libstealthpool/crypto/Digest.h>
#include <libstealthpool/crypto/Random.h>
#include <libstealthpool/zkp/Field.h>
#include <libstealthpool/zkp/MiMC.h>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace stealthpool {
namespace zkp {

namespace pt = boost::property_tree;

namespace {

uint256 random31() {
    uint256 v;
    randomBytes(v.data() + 1, v.size() - 1);
    return v;
}

std::string fieldString(const uint256& v) {
    return uintToDecimal(v);
}

uint256 readField(const pt::ptree& tree, const std::string& key) {
    auto const s = tree.get_optional<std::string>(key);
    if (!s) {
        throw std::invalid_argument("note is missing '" + key + "'");
    }
    auto const v = uintFromDecimal(*s);
    if (!isInField(v)) {
        throw std::invalid_argument("note field '" + key + "' is not below the modulus");
    }
    return v;
}

} // namespace

Note Note::fromSecrets(const uint256& nullifier, const uint256& secret) {
    if (!isInField(nullifier) || !isInField(secret)) {
        throw std::invalid_argument("note secrets must be below the field modulus");
    }
    Note note;
    note.nullifier = nullifier;
    note.secret = secret;
    note.commitment = MiMCSponge::hash2(nullifier, secret);
    note.nullifierHash = MiMCSponge::hash2(nullifier, uint256{});
    return note;
}

Note Note::random() {
    uint256 nullifier = random31();
    uint256 secret = random31();
    Note note = fromSecrets(nullifier, secret);
    secureErase(nullifier.data(), nullifier.size());
    secureErase(secret.data(), secret.size());
    return note;
}

bool Note::isValid() const {
    if (!isInField(nullifier) || !isInField(secret)) {
        return false;
    }
    return commitment == MiMCSponge::hash2(nullifier, secret) &&
        nullifierHash == MiMCSponge::hash2(nullifier, uint256{});
}

std::string noteToJson(const NoteRecord& record) {
    pt::ptree tree;
    tree.put("nullifier", fieldString(record.note.nullifier));
    tree.put("secret", fieldString(record.note.secret));
    tree.put("commitment", fieldString(record.note.commitment));
    tree.put("nullifierHash", fieldString(record.note.nullifierHash));
    if (record.note.leafIndex) {
        tree.put("leafIndex", *record.note.leafIndex);
    }
    tree.put("denomination", uintToDecimal(record.denomination));
    tree.put("poolAddress", "0x" + to_string(record.poolAddress));
    if (!record.createdAt.empty()) {
        tree.put("createdAt", record.createdAt);
    }

    std::ostringstream out;
    pt::write_json(out, tree);
    return out.str();
}

NoteRecord noteFromJson(const std::string& json) {
    pt::ptree tree;
    try {
        std::istringstream in(json);
        pt::read_json(in, tree);
    } catch (const pt::json_parser_error& e) {
        throw std::invalid_argument("malformed note: " + e.message());
    }

    NoteRecord record;
    record.note = Note::fromSecrets(readField(tree, "nullifier"), readField(tree, "secret"));

    // Stored hashes are redundant; reject a file whose hashes disagree.
    if (record.note.commitment != readField(tree, "commitment") ||
        record.note.nullifierHash != readField(tree, "nullifierHash")) {
        throw std::invalid_argument("note hashes do not match its secrets");
    }

    if (auto const index = tree.get_optional<std::uint64_t>("leafIndex")) {
        record.note.leafIndex = *index;
    }
    record.denomination = uintFromDecimal(tree.get<std::string>("denomination", "0"));
    record.poolAddress = uint160::fromHex(
        tree.get<std::string>("poolAddress", "0x0000000000000000000000000000000000000000"));
    record.createdAt = tree.get<std::string>("createdAt", "");
    return record;
}

void saveNote(const NoteRecord& record, const std::string& path) {
    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        throw std::runtime_error("unable to open note file for writing: " + path);
    }
    file << noteToJson(record);
    if (!file) {
        throw std::runtime_error("failed writing note file: " + path);
    }
}

NoteRecord loadNote(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("unable to open note file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return noteFromJson(buffer.str());
}

} // namespace zkp
} // namespace stealthpool
