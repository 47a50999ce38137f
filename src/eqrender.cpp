// eqrender.cpp
// MIT License (c) 2026 Pedro

int run_eqrender(int argc, char** argv);

int main(int argc, char** argv) {
    return run_eqrender(argc, argv);
}
