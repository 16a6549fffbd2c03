#include "core/Config.h"
#include "core/ConfigLoader.h"
#include "core/ConfigValidator.h"
#include "core/Errors.h"
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    std::string input(reinterpret_cast<const char*>(data), size);

    daily_dash::Config cfg;
    try {
        cfg = daily_dash::ConfigLoader().parse(input);
    } catch (const daily_dash::ConfigError&) {
        return 0; // rejected input is fine; anything else escaping is a bug
    }
    daily_dash::ConfigValidator validator;
    validator.validate(cfg);

    return 0; // Non-zero return values are reserved for future use.
}
