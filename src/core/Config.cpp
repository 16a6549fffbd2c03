#include "Config.h"

namespace daily_dash {

const char* feed_kind_name(FeedKind k){
    return k == FeedKind::Json ? "json" : "rss";
}

}
