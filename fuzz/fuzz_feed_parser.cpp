#include "fetchers/FeedParser.h"
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    if (size == 0) return 0;
    // First byte picks the feed kind and path, the rest is the body.
    std::string body(reinterpret_cast<const char*>(data) + 1, size - 1);

    daily_dash::FeedSource source;
    source.name = "fuzz";
    source.url = "http://localhost/feed";
    source.kind = (data[0] & 1) ? daily_dash::FeedKind::Json : daily_dash::FeedKind::Rss;
    static const char* paths[] = {"", "$.items", "data.children", "results[0].items"};
    source.json_path = paths[(data[0] >> 1) & 3];

    auto result = daily_dash::feed_parser::parse(source, body);
    if (result.ok()) {
        auto payload = daily_dash::feed_parser::to_json(result.value());
        auto back = daily_dash::feed_parser::from_json(payload);
        if (back.size() != result.value().size()) __builtin_trap();
    }
    return 0;
}
