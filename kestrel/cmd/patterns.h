#pragma once
#include <memory>
#include <regex>
#include <string_view>

using pattern_ptr = std::shared_ptr<const std::regex>;

// Predefined parameter patterns. Each returns a shared, immutable regex
// compiled on first use.
namespace patterns {

pattern_ptr any();
pattern_ptr integer();
pattern_ptr uinteger();
pattern_ptr floating();
pattern_ptr boolean();
pattern_ptr channel();
pattern_ptr mode();
pattern_ptr url();

// Resolves a predefined name ("int", "channel", ...) or, failing that,
// compiles spec as an ECMAScript regex. Null if spec does not compile.
pattern_ptr lookup(std::string_view spec);

}
