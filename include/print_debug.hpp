#pragma once
#include <iostream>
#include <vector>

#include "token.hpp"

// Dumps one line per token: index, type name, value and location.
void print_tokens(const std::vector<Token>& tokens, std::ostream& out = std::cerr);
