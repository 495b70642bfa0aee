#pragma once

namespace bcfix {

int correct(int argc, char* argv[]);
int count(int argc, char* argv[]);

}  // namespace bcfix
