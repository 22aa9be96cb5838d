#include <mediasync/sync/sync.hpp>

#include <cctype>
#include <string>

namespace mediasync::sync {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

std::string percent_decode(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '%' && i + 2 < in.size()) {
            int hi = hex_value(in[i + 1]);
            int lo = hex_value(in[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(in[i]);
    }
    return out;
}

} // namespace

std::string urlBasename(std::string_view url) {
    auto end = url.find_first_of("?#");
    if (end != std::string_view::npos)
        url = url.substr(0, end);

    // Skip "scheme://host" so a bare host is not mistaken for a file name
    auto scheme = url.find("://");
    if (scheme != std::string_view::npos) {
        auto pathStart = url.find('/', scheme + 3);
        url = pathStart == std::string_view::npos ? std::string_view{} : url.substr(pathStart);
    }

    auto slash = url.rfind('/');
    auto base = percent_decode(slash == std::string_view::npos ? url : url.substr(slash + 1));

    // An encoded separator must not turn the name into a path
    if (base.find('/') != std::string::npos || base.find('\0') != std::string::npos ||
        base == "." || base == "..")
        return std::string{};
    return base;
}

} // namespace mediasync::sync
