#include <bulkpush/app.hpp>

int main(int argc, char **argv) { return bulkpush::App{}.run(argc, argv); }
