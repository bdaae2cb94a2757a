#include <iostream>
#include <map>
#include <string>

typedef std::map<std::string, int(*)(int, char**)> SubCmdMap;
#define _(x) extern int x##_main(int, char**)
#define __(x) {#x, &x##_main}

 _(info);  _(export);

const SubCmdMap subcommands{
__(info), __(export)
};

#undef _
#undef __

int main(int argc, char** argv) {
	if (argc == 1) {
		std::cout << "Usage: sims <subcommand> [options...]\n"
							<< "The following subcommands are available:\n"
							<< "    info    - lists the m/z intervals stored in a .bif6 file\n"
							<< "    export  - writes the interval images of a .bif6 file to HDF5\n"
							<< "\n"
							<< "To get help for a subcommand, run it without any options."
							<< std::endl;
		return 0;
	}

	auto it = subcommands.find(argv[1]);
	if (it == subcommands.end()) {
		std::cout << "Unknown subcommand '" << argv[1] << "'" << std::endl;
		return -1;
	}

	return it->second(argc - 1, argv + 1);
}
