#include <duet/call/room_link.hpp>
#include <duet/signaling/message.hpp>

#include <random>

namespace duet::call {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

core::Result<std::string> percentDecode(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '+') {
            out.push_back(' ');
        }
        else if (c == '%') {
            if (i + 2 >= text.size()) {
                return {core::ErrorCode::InvalidArgument, "Truncated percent escape in link"};
            }
            int high = hexValue(text[i + 1]);
            int low = hexValue(text[i + 2]);
            if (high < 0 || low < 0) {
                return {core::ErrorCode::InvalidArgument, "Malformed percent escape in link"};
            }
            out.push_back(static_cast<char>(high * 16 + low));
            i += 2;
        }
        else {
            out.push_back(c);
        }
    }
    return out;
}

} // namespace

std::string generateRoomId() {
    static const char alphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 35);

    std::string id = "room-";
    for (int i = 0; i < 9; ++i) {
        id.push_back(alphabet[dis(gen)]);
    }
    return id;
}

std::string makeShareLink(std::string_view link_base, std::string_view room_id) {
    std::string link(link_base);
    link += (link.find('?') == std::string::npos) ? '?' : '&';
    link += "room=";
    link += room_id;
    return link;
}

core::Result<std::string> roomFromLink(std::string_view link) {
    std::string_view candidate = link;

    auto query = link.find('?');
    if (query != std::string_view::npos) {
        std::string_view params = link.substr(query + 1);
        if (auto fragment = params.find('#'); fragment != std::string_view::npos) {
            params = params.substr(0, fragment);
        }

        bool found = false;
        while (!params.empty()) {
            auto amp = params.find('&');
            std::string_view pair = params.substr(0, amp);
            if (pair.substr(0, 5) == "room=") {
                candidate = pair.substr(5);
                found = true;
                break;
            }
            if (amp == std::string_view::npos) {
                break;
            }
            params.remove_prefix(amp + 1);
        }

        if (!found) {
            return {core::ErrorCode::InvalidRoom, "Link has no room parameter"};
        }
    }

    auto decoded = percentDecode(candidate);
    if (!decoded) {
        return decoded.error();
    }

    if (!signaling::isValidRoomId(decoded.value())) {
        return {core::ErrorCode::InvalidRoom, "Invalid room id in link: " + decoded.value()};
    }
    return decoded;
}

} // namespace duet::call
