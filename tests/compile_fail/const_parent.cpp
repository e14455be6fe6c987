// Must not compile: a link owns its parent by value, so the parent type cannot be const.
#include <objchain/objchain.hpp>

auto main() -> int { return static_cast<int>(sizeof(objchain::link<int, const objchain::terminal<int>>)); }
