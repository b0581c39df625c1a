#include "stagehand/core/utils.hpp"
#include "stagehand/core/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <random>
#include <regex>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>

#include <openssl/evp.h>

namespace stagehand::core {

std::string get_iso_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string get_run_id() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S") << '_';

    const char* hex = "0123456789abcdef";
    for (int i = 0; i < 8; ++i) {
        oss << hex[dis(gen)];
    }

    return oss.str();
}

int64_t now_unix_ns() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string read_text(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

void write_text(const fs::path& path, const std::string& text) {
    std::ofstream file(path);
    if (!file) {
        throw IOError("Cannot create file: " + path.string());
    }
    file << text;
}

void append_text(const fs::path& path, const std::string& text) {
    std::ofstream file(path, std::ios::out | std::ios::app);
    if (!file) {
        throw IOError("Cannot open file for append: " + path.string());
    }
    file << text;
    file.flush();
    if (!file) {
        throw IOError("Cannot write file: " + path.string());
    }
}

static void write_all(int fd, const std::string& text, const fs::path& path) {
    const char* p = text.data();
    size_t left = text.size();
    while (left > 0) {
        ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw IOError("write failed for " + path.string() + ": " + std::strerror(errno));
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
}

void fsync_directory(const fs::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        throw IOError("Cannot open directory: " + dir.string() + ": " + std::strerror(errno));
    }
    int rc = ::fsync(fd);
    int err = errno;
    ::close(fd);
    if (rc != 0) {
        throw IOError("fsync failed for directory " + dir.string() + ": " + std::strerror(err));
    }
}

void write_text_durable(const fs::path& path, const std::string& text) {
    fs::path dir = path.parent_path();
    if (dir.empty()) dir = ".";

    fs::path tmp = path;
    tmp += ".tmp." + std::to_string(::getpid());

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw IOError("Cannot create file: " + tmp.string() + ": " + std::strerror(errno));
    }
    try {
        write_all(fd, text, tmp);
    } catch (const IOError&) {
        ::close(fd);
        ::unlink(tmp.c_str());
        throw;
    }
    if (::fsync(fd) != 0) {
        int err = errno;
        ::close(fd);
        ::unlink(tmp.c_str());
        throw IOError("fsync failed for " + tmp.string() + ": " + std::strerror(err));
    }
    ::close(fd);

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        int err = errno;
        ::unlink(tmp.c_str());
        throw IOError("rename " + tmp.string() + " -> " + path.string() + " failed: " + std::strerror(err));
    }
    fsync_directory(dir);
}

std::string sha256_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw IOError("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        throw IOError("EVP_DigestInit_ex failed");
    }

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (EVP_DigestUpdate(ctx, buffer, static_cast<size_t>(file.gcount())) != 1) {
            EVP_MD_CTX_free(ctx);
            throw IOError("EVP_DigestUpdate failed for " + path.string());
        }
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &hash_len) != 1) {
        EVP_MD_CTX_free(ctx);
        throw IOError("EVP_DigestFinal_ex failed for " + path.string());
    }
    EVP_MD_CTX_free(ctx);

    std::ostringstream oss;
    for (unsigned int i = 0; i < hash_len; ++i) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(hash[i]);
    }
    return oss.str();
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

bool ends_with(const std::string& str, const std::string& suffix) {
    if (suffix.size() > str.size()) return false;
    return str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    if (prefix.size() > str.size()) return false;
    return str.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream iss(str);
    std::string part;
    while (std::getline(iss, part, delimiter)) {
        parts.push_back(part);
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::ostringstream oss;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) oss << delimiter;
        oss << parts[i];
    }
    return oss.str();
}

std::string translate_name(const std::string& name) {
    std::string out = to_lower(trim(name));
    std::replace(out.begin(), out.end(), ' ', '-');
    return out;
}

std::string shell_quote(const std::string& word) {
    if (word.empty()) return "''";
    bool safe = std::all_of(word.begin(), word.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.' ||
               c == '/' || c == ':' || c == '=' || c == ',' || c == '+' || c == '@';
    });
    if (safe) return word;

    std::string out = "'";
    for (char c : word) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

bool has_glob_chars(const std::string& pattern) {
    return pattern.find_first_of("*?") != std::string::npos;
}

bool glob_match(const std::string& pattern, const std::string& str) {
    std::string regex_pattern;
    for (char c : pattern) {
        switch (c) {
            case '*': regex_pattern += ".*"; break;
            case '?': regex_pattern += "."; break;
            case '.': case '(': case '[': case ']': case ')': case '+': case '^': case '$':
            case '{': case '}': case '|': case '\\':
                regex_pattern += '\\';
                regex_pattern += c;
                break;
            default: regex_pattern += c; break;
        }
    }

    std::regex re(regex_pattern);
    return std::regex_match(str, re);
}

std::vector<fs::path> glob(const fs::path& dir, const std::string& pattern) {
    std::vector<fs::path> matches;

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return matches;
    }

    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        std::string filename = entry.path().filename().string();
        if (glob_match(pattern, filename)) {
            matches.push_back(entry.path());
        }
    }

    std::sort(matches.begin(), matches.end());
    return matches;
}

std::vector<fs::path> expand_path_pattern(const fs::path& pattern) {
    std::string leaf = pattern.filename().string();
    if (!has_glob_chars(leaf)) {
        std::error_code ec;
        if (fs::exists(fs::symlink_status(pattern, ec))) return {pattern};
        return {};
    }
    fs::path dir = pattern.parent_path();
    if (dir.empty()) dir = ".";
    return glob(dir, leaf);
}

} // namespace stagehand::core
