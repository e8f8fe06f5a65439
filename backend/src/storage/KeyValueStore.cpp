#include "KeyValueStore.hpp"
#include <cctype>

bool isValidStoreKey(const std::string& key) {
    if (key.empty()) return false;
    for (unsigned char ch : key) {
        if (!std::isalnum(ch) && ch != '_' && ch != '-') return false;
    }
    return true;
}
