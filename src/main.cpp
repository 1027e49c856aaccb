#include "app/Application.hpp"

int main(int argc, char** argv) { return app::Application{ argc, argv }.run(); }
