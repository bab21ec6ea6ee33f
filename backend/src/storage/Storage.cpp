#include "Storage.hpp"
#include "../core/Errors.hpp"
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <sodium.h>
#include <spdlog/spdlog.h>

static const char MAGIC_HDR[] = "VBDATA1\n";
static const char BODY_VERSION[] = "vocabra-store 1";

static constexpr std::size_t ENC_KEY_BYTES = crypto_secretbox_KEYBYTES;
static constexpr std::size_t SALT_BYTES = crypto_pwhash_SALTBYTES;

/* -------------------------
   Plain body
   -------------------------
   #word / #aggregate / #session blocks, one field per line for free text,
   space separated numbers otherwise. Optional strings are written as
   "+value" or "-".
*/

namespace {

class LineReader {
public:
    explicit LineReader(const std::string& text) : iss(text) {}

    bool next(std::string& line) {
        if (!std::getline(iss, line)) return false;
        ++number;
        return true;
    }

    std::string require(const char* what) {
        std::string line;
        if (!next(line)) fail(std::string("unexpected end of data, expected ") + what);
        return line;
    }

    [[noreturn]] void fail(const std::string& why) const {
        spdlog::error("Store body corrupt at line {}: {}", number, why);
        throw StoreUnavailable("corrupt store data at line " + std::to_string(number) + ": " + why);
    }

private:
    std::istringstream iss;
    int number = 0;
};

std::string optionalLine(const std::optional<std::string>& v) {
    return v ? "+" + *v : "-";
}

std::optional<std::string> parseOptional(const std::string& line) {
    if (!line.empty() && line[0] == '+') return line.substr(1);
    return std::nullopt;
}

void writeWord(std::ostringstream& oss, const std::string& language, const WordProgress& w) {
    oss << "#word\n"
        << language << "\n"
        << w.vocabulary_id << "\n"
        << w.word << "\n"
        << w.correct_count << " " << w.incorrect_count << " " << w.mastery_level << " "
        << w.last_practiced << " " << w.next_review << " "
        << w.interval_days << " " << w.last_interval_days << " "
        << std::setprecision(10) << w.easiness_factor << " "
        << w.consecutive_correct_count << " " << w.leitner_box << " " << w.total_reviews << "\n"
        << modesAsLine(w.completed_modes_in_cycle) << "\n";
}

void writeAggregate(std::ostringstream& oss, const UserPracticeProgress& a) {
    oss << "#aggregate\n"
        << a.language << "\n"
        << a.total_sessions << " " << a.total_words_practiced << " "
        << a.current_streak << " " << a.longest_streak << " "
        << (a.last_practice_date ? a.last_practice_date->toString() : "-") << "\n"
        << a.practiced_ids.size() << "\n";
    for (const auto& id : a.practiced_ids) oss << id << "\n";
}

void writeSession(std::ostringstream& oss, const PracticeSession& s) {
    oss << "#session\n"
        << s.collection_id << "\n"
        << modeToString(s.mode) << "\n"
        << s.language << "\n"
        << optionalLine(s.topic) << "\n"
        << optionalLine(s.level) << "\n"
        << s.started_at << " " << s.completed_at << " " << s.duration_seconds << "\n"
        << s.results.size() << "\n";
    for (const auto& r : s.results) {
        oss << r.vocabulary_id << "\n"
            << r.word << "\n"
            << (r.correct ? 1 : 0) << " " << modeToString(r.mode) << " " << r.time_spent_seconds << "\n";
    }
}

void readWord(LineReader& in, StoreData& data) {
    std::string language = in.require("word language");
    WordProgress w;
    w.vocabulary_id = in.require("vocabulary id");
    w.word = in.require("word");

    std::istringstream nums(in.require("word counters"));
    if (!(nums >> w.correct_count >> w.incorrect_count >> w.mastery_level
        >> w.last_practiced >> w.next_review
        >> w.interval_days >> w.last_interval_days >> w.easiness_factor
        >> w.consecutive_correct_count >> w.leitner_box >> w.total_reviews)) {
        in.fail("bad counters for '" + w.vocabulary_id + "'");
    }
    w.completed_modes_in_cycle = modesFromLine(in.require("cycle modes"));

    if (w.vocabulary_id.empty()) in.fail("word without vocabulary id");
    data.words[language][w.vocabulary_id] = w;
}

void readAggregate(LineReader& in, StoreData& data) {
    UserPracticeProgress a;
    a.language = in.require("aggregate language");

    std::istringstream nums(in.require("aggregate counters"));
    std::string date;
    if (!(nums >> a.total_sessions >> a.total_words_practiced
        >> a.current_streak >> a.longest_streak >> date)) {
        in.fail("bad aggregate counters for '" + a.language + "'");
    }
    if (date != "-") {
        a.last_practice_date = CalendarDate::parse(date);
        if (!a.last_practice_date) in.fail("bad date '" + date + "'");
    }

    size_t count = 0;
    std::istringstream cnt(in.require("practiced id count"));
    if (!(cnt >> count)) in.fail("bad practiced id count");
    for (size_t i = 0; i < count; ++i) {
        a.practiced_ids.insert(in.require("practiced id"));
    }

    data.aggregates[a.language] = a;
}

void readSession(LineReader& in, StoreData& data) {
    PracticeSession s;
    s.collection_id = in.require("collection id");
    try {
        s.mode = parseMode(in.require("session mode"));
    }
    catch (const ValidationError& e) {
        in.fail(e.what());
    }
    s.language = in.require("session language");
    s.topic = parseOptional(in.require("topic"));
    s.level = parseOptional(in.require("level"));

    std::istringstream times(in.require("session times"));
    if (!(times >> s.started_at >> s.completed_at >> s.duration_seconds)) {
        in.fail("bad session times");
    }

    size_t count = 0;
    std::istringstream cnt(in.require("result count"));
    if (!(cnt >> count)) in.fail("bad result count");

    for (size_t i = 0; i < count; ++i) {
        PracticeResult r;
        r.vocabulary_id = in.require("result vocabulary id");
        r.word = in.require("result word");

        std::istringstream fields(in.require("result fields"));
        int correct = 0;
        std::string mode;
        if (!(fields >> correct >> mode >> r.time_spent_seconds)) in.fail("bad result fields");
        r.correct = correct != 0;
        try {
            r.mode = parseMode(mode);
        }
        catch (const ValidationError& e) {
            in.fail(e.what());
        }
        s.results.push_back(r);
    }

    s.recount();
    data.sessions.push_back(s);
}

} // namespace

std::string Storage::serializeStore(const StoreData& data) {
    std::ostringstream oss;
    oss << BODY_VERSION << "\n";

    for (const auto& lang : data.words) {
        for (const auto& p : lang.second) writeWord(oss, lang.first, p.second);
    }
    for (const auto& a : data.aggregates) writeAggregate(oss, a.second);
    for (const auto& s : data.sessions) writeSession(oss, s);

    return oss.str();
}

StoreData Storage::parseStore(const std::string& plain) {
    StoreData data;
    LineReader in(plain);

    std::string line;
    if (!in.next(line) || line != BODY_VERSION) {
        in.fail("unknown body version");
    }

    while (in.next(line)) {
        if (line.empty()) continue;
        if (line == "#word") readWord(in, data);
        else if (line == "#aggregate") readAggregate(in, data);
        else if (line == "#session") readSession(in, data);
        else in.fail("unexpected line '" + line + "'");
    }
    return data;
}

/* -------------------------
   Encrypted envelope
   ------------------------- */

EncryptedFileStore::EncryptedFileStore(const std::string& file)
    : filename(file)
{
    spdlog::info("EncryptedFileStore initialized with file '{}'", filename);
}

EncryptedFileStore::~EncryptedFileStore() {
    close();
}

void EncryptedFileStore::deriveKey(const std::string& passphrase) {
    spdlog::debug("Deriving store key (not logging passphrase or salt)");

    key.assign(ENC_KEY_BYTES, 0);
    if (crypto_pwhash(key.data(),
        ENC_KEY_BYTES,
        passphrase.c_str(),
        static_cast<unsigned long long>(passphrase.size()),
        salt.data(),
        crypto_pwhash_OPSLIMIT_INTERACTIVE,
        crypto_pwhash_MEMLIMIT_INTERACTIVE,
        crypto_pwhash_ALG_DEFAULT) != 0)
    {
        key.clear();
        spdlog::error("crypto_pwhash failed during store key derivation");
        throw StoreUnavailable("key derivation failed (out of memory)");
    }
}

void EncryptedFileStore::open(const std::string& passphrase) {
    spdlog::info("Opening encrypted store '{}'", filename);
    close();
    restore(StoreData());

    std::ifstream in(filename, std::ios::binary);
    if (!in) {
        spdlog::warn("Store file '{}' not found; starting empty", filename);
        salt.assign(SALT_BYTES, 0);
        randombytes_buf(salt.data(), salt.size());
        deriveKey(passphrase);
        return;
    }

    char hdr[sizeof(MAGIC_HDR) - 1];
    in.read(hdr, sizeof(hdr));
    if (in.gcount() != sizeof(hdr) || std::strncmp(hdr, MAGIC_HDR, sizeof(hdr)) != 0) {
        spdlog::error("Invalid magic header in '{}'", filename);
        throw StoreUnavailable("'" + filename + "' is not a store file");
    }

    salt.assign(SALT_BYTES, 0);
    in.read(reinterpret_cast<char*>(salt.data()), static_cast<std::streamsize>(salt.size()));
    if (in.gcount() != static_cast<std::streamsize>(salt.size())) {
        spdlog::error("Failed to read salt");
        throw StoreUnavailable("truncated store file '" + filename + "'");
    }

    unsigned char nonce[crypto_secretbox_NONCEBYTES];
    in.read(reinterpret_cast<char*>(nonce), sizeof(nonce));
    if (in.gcount() != sizeof(nonce)) {
        spdlog::error("Failed to read nonce");
        throw StoreUnavailable("truncated store file '" + filename + "'");
    }

    std::vector<unsigned char> ciphertext(
        (std::istreambuf_iterator<char>(in)),
        std::istreambuf_iterator<char>());

    if (ciphertext.size() < crypto_secretbox_MACBYTES) {
        spdlog::error("Ciphertext too short");
        throw StoreUnavailable("truncated store file '" + filename + "'");
    }

    deriveKey(passphrase);

    std::vector<unsigned char> plain(ciphertext.size() - crypto_secretbox_MACBYTES);
    if (crypto_secretbox_open_easy(plain.data(), ciphertext.data(), ciphertext.size(), nonce, key.data()) != 0) {
        spdlog::error("Decryption failed for '{}'", filename);
        close();
        throw StoreUnavailable("cannot decrypt '" + filename + "' (wrong passphrase?)");
    }

    std::string plain_str(reinterpret_cast<const char*>(plain.data()), plain.size());
    sodium_memzero(plain.data(), plain.size());

    try {
        restore(Storage::parseStore(plain_str));
    }
    catch (const StoreUnavailable&) {
        close();
        throw;
    }

    spdlog::info("Loaded {} language(s), {} session(s)", data.words.size(), data.sessions.size());
}

void EncryptedFileStore::flush() {
    if (!isOpen()) {
        throw StoreUnavailable("store '" + filename + "' is not open");
    }

    std::string plain = Storage::serializeStore(data);
    spdlog::info("Saving encrypted store to '{}' ({} bytes)", filename, plain.size());

    const unsigned char* p = reinterpret_cast<const unsigned char*>(plain.data());
    unsigned long long plen = plain.size();

    std::vector<unsigned char> ciphertext(plen + crypto_secretbox_MACBYTES);

    unsigned char nonce[crypto_secretbox_NONCEBYTES];
    randombytes_buf(nonce, sizeof(nonce));

    if (crypto_secretbox_easy(ciphertext.data(), p, plen, nonce, key.data()) != 0) {
        spdlog::error("Encryption failed");
        throw StoreUnavailable("encryption failed");
    }

    std::ofstream out(filename, std::ios::binary | std::ios::trunc);
    if (!out) {
        spdlog::error("Failed to open '{}' for encrypted write", filename);
        throw StoreUnavailable("cannot write '" + filename + "'");
    }

    out.write(MAGIC_HDR, sizeof(MAGIC_HDR) - 1);
    out.write(reinterpret_cast<const char*>(salt.data()), static_cast<std::streamsize>(salt.size()));
    out.write(reinterpret_cast<const char*>(nonce), sizeof(nonce));
    out.write(reinterpret_cast<const char*>(ciphertext.data()), static_cast<std::streamsize>(ciphertext.size()));
    out.flush();

    if (!out) {
        spdlog::error("Write to '{}' failed", filename);
        throw StoreUnavailable("write to '" + filename + "' failed");
    }
}

void EncryptedFileStore::close() {
    if (!key.empty()) {
        spdlog::debug("Clearing store key from memory");
        sodium_memzero(key.data(), key.size());
        key.clear();
    }
}

/* -------------------------
   Settings file
   ------------------------- */

bool Storage::loadSettings(LearningSettings& settings, const std::string& filename) {
    spdlog::info("Loading learning settings from '{}'", filename);
    std::ifstream in(filename);
    if (!in) {
        spdlog::warn("Settings file '{}' not found; using defaults", filename);
        return false;
    }

    std::stringstream buf;
    buf << in.rdbuf();
    settings.deserialize(buf.str());
    return true;
}

bool Storage::saveSettings(const LearningSettings& settings, const std::string& filename) {
    spdlog::info("Saving learning settings to '{}'", filename);
    std::ofstream out(filename, std::ios::trunc);
    if (!out) {
        spdlog::error("Failed to open '{}' for writing settings", filename);
        return false;
    }
    out << settings.serialize();
    return static_cast<bool>(out);
}
