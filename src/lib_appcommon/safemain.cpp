#include <iostream> // cerr
#include <stdexcept>

// user-provided, returns the exit code
extern int safeMain(int argc, const char* argv[]);

extern const char *g_appName;

int main(int argc, char const* argv[]) {
	try {
		return safeMain(argc, argv);
	} catch (std::exception const& e) {
		std::cerr << "[" << g_appName << "] " << "Error: " << e.what() << std::endl;
		return 1;
	}
}
