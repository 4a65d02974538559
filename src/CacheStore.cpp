#include "CacheStore.hpp"
#include "ProxyError.hpp"
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iterator>
#include <limits>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <vector>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <boost/algorithm/hex.hpp>
#include <boost/endian/conversion.hpp>
#include <openssl/evp.h>

namespace fs = std::filesystem;

namespace {

const char kMagic[4] = {'P', 'X', 'C', '1'};

void putU32(std::string & out, uint64_t value) {
    if (value > std::numeric_limits<uint32_t>::max()) {
        throw StoreError("field of " + std::to_string(value) + " bytes does not fit a record");
    }
    unsigned char big[sizeof(uint32_t)];
    boost::endian::store_big_u32(big, static_cast<uint32_t>(value));
    out.append(std::begin(big), std::end(big));
}

void putBytes(std::string & out, const char * data, size_t len) {
    putU32(out, len);
    out.append(data, len);
}

// bounds-checked cursor over one record
class RecordReader {
    public:
        explicit RecordReader(const std::string & data) : data(data), pos(0) {}

        uint32_t u32(const char * what) {
            need(sizeof(uint32_t), what);
            uint32_t value = boost::endian::load_big_u32(
                reinterpret_cast<const unsigned char *>(data.data()) + pos);
            pos += sizeof(uint32_t);
            return value;
        }

        std::string bytes(const char * what) {
            uint32_t len = u32(what);
            need(len, what);
            std::string value = data.substr(pos, len);
            pos += len;
            return value;
        }

        void magic() {
            need(sizeof(kMagic), "magic");
            if (std::memcmp(data.data(), kMagic, sizeof(kMagic)) != 0) {
                throw StoreError("bad record magic");
            }
            pos += sizeof(kMagic);
        }

        bool atEnd() const { return pos == data.size(); }

    private:
        void need(size_t len, const char * what) {
            if (data.size() - pos < len) {
                throw StoreError(std::string("record truncated in ") + what);
            }
        }

        const std::string & data;
        size_t pos;
};

bool isHexKey(const std::string & key) {
    if (key.empty()) {
        return false;
    }
    for (char c : key) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
            return false;
        }
    }
    return true;
}

}

CacheStore::CacheStore(const std::string & base_dir) : base_dir(base_dir) {}

std::string CacheStore::computeKey(const std::string & method,
                                   const std::string & host,
                                   const std::string & target) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    std::string location = host + target;
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), method.data(), method.size()) != 1 ||
        EVP_DigestUpdate(ctx.get(), location.data(), location.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    std::string key;
    key.reserve(digest_len * 2);
    boost::algorithm::hex_lower(digest, digest + digest_len, std::back_inserter(key));
    return key;
}

fs::path CacheStore::pathFor(const std::string & key) const {
    if (!isHexKey(key)) {
        throw StoreError("invalid cache key \"" + key + "\"");
    }
    return base_dir / key;
}

bool CacheStore::contains(const std::string & key) const {
    std::error_code ec;
    return fs::is_regular_file(pathFor(key), ec);
}

// Record layout, all integers unsigned 32-bit big-endian:
//   "PXC1"
//   status line length, status line
//   header entry count, then per entry: name length, name, value length, value
//   body length, body
std::string CacheStore::encode(const CacheEntry & entry) {
    std::string out(kMagic, sizeof(kMagic));
    putBytes(out, entry.getResponseLine().data(), entry.getResponseLine().size());

    const http::fields & headers = entry.getResponseHeaders();
    putU32(out, std::distance(headers.begin(), headers.end()));
    for (const auto & field : headers) {
        putBytes(out, field.name_string().data(), field.name_string().size());
        putBytes(out, field.value().data(), field.value().size());
    }

    putBytes(out, entry.getResponseBody().data(), entry.getResponseBody().size());
    return out;
}

CacheEntry CacheStore::decode(const std::string & record) {
    RecordReader reader(record);
    reader.magic();
    std::string response_line = reader.bytes("status line");

    http::fields headers;
    uint32_t count = reader.u32("header count");
    for (uint32_t i = 0; i < count; i++) {
        std::string name = reader.bytes("header name");
        std::string value = reader.bytes("header value");
        if (name.empty()) {
            throw StoreError("empty header name in record");
        }
        try {
            headers.insert(name, value);
        }
        catch (const std::length_error & e) {
            throw StoreError("header \"" + name.substr(0, 32) + "\" too large: " + e.what());
        }
    }

    std::string body = reader.bytes("body");
    if (!reader.atEnd()) {
        throw StoreError("trailing bytes after record body");
    }
    return CacheEntry(response_line, headers, body);
}

std::optional<CacheEntry> CacheStore::get(const std::string & key) const {
    fs::path path = pathFor(key);
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            return std::nullopt;
        }
        throw StoreError("cannot open " + path.string());
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    if (file.bad()) {
        throw StoreError("failed reading " + path.string());
    }

    try {
        return decode(contents.str());
    }
    catch (const StoreError & e) {
        logger.error("corrupt cache record " + key + ": " + e.what());
        throw;
    }
}

void CacheStore::put(const std::string & key, const CacheEntry & entry) {
    fs::path path = pathFor(key);
    std::string record = encode(entry);

    std::error_code ec;
    fs::create_directories(base_dir, ec);
    if (ec) {
        throw StoreError("cannot create " + base_dir.string() + ": " + ec.message());
    }

    // mkstemp wants a mutable, null terminated template
    std::string tmp_name = (base_dir / ("." + key + ".XXXXXX")).string();
    std::vector<char> tmp_template(tmp_name.begin(), tmp_name.end());
    tmp_template.push_back('\0');
    int fd = mkstemp(tmp_template.data());
    if (fd < 0) {
        throw StoreError("cannot create temporary file in " + base_dir.string() + ": " +
                         std::string(strerror(errno)));
    }
    tmp_name = tmp_template.data();

    size_t written = 0;
    while (written < record.size()) {
        ssize_t n = write(fd, record.data() + written, record.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            close(fd);
            unlink(tmp_name.c_str());
            throw StoreError("cannot write " + tmp_name + ": " + std::string(strerror(err)));
        }
        written += n;
    }
    if (fchmod(fd, 0644) != 0) {
        logger.warning("cannot chmod " + tmp_name + ": " + std::string(strerror(errno)));
    }
    if (close(fd) != 0) {
        int err = errno;
        unlink(tmp_name.c_str());
        throw StoreError("cannot close " + tmp_name + ": " + std::string(strerror(err)));
    }

    fs::rename(tmp_name, path, ec);
    if (ec) {
        unlink(tmp_name.c_str());
        throw StoreError("cannot rename " + tmp_name + " to " + path.string() + ": " + ec.message());
    }
    logger.debug("stored " + std::to_string(record.size()) + " bytes at " + path.string());
}

size_t CacheStore::clear() {
    std::error_code ec;
    if (!fs::is_directory(base_dir, ec)) {
        return 0;
    }
    size_t removed = 0;
    for (fs::directory_iterator it(base_dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code remove_ec;
        if (it->is_regular_file(remove_ec) && fs::remove(it->path(), remove_ec)) {
            removed++;
        }
        if (remove_ec) {
            logger.warning("cannot remove " + it->path().string() + ": " + remove_ec.message());
        }
    }
    if (ec) {
        logger.warning("cannot list " + base_dir.string() + ": " + ec.message());
    }
    logger.info("cleared " + std::to_string(removed) + " entries from " + base_dir.string());
    return removed;
}
