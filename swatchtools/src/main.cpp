#include <map>
#include <string>
#include <filesystem>
#include <vector>
#include <chrono>
#include <algorithm>
#include <stdint.h>
#include <stdlib.h>
#include <stdio.h>
namespace fs = std::filesystem;

#include <swatchio_image.hpp>
#include <kmeans.hpp>
#include <palette.hpp>
#include <palette_render.hpp>
#include "logging.hpp"

#ifdef SWATCH_ON_WINDOWS
#include <windows.h>
#endif

#ifdef SWATCH_ON_LINUX
#include <locale.h>
#endif

struct settings {
	std::string inpath = "";
	std::string outpath = "";
	int k_count = Swatch::KMEANS_DEFAULT_K;
	int rounds = Swatch::KMEANS_DEFAULT_ROUNDS;
	int downsample = 128;
	uint64_t seed = 0;
	int sheet_width = 512;
	int sheet_height = 128;
};

//decode, shrink, cluster, classify
static bool build_palette(settings& set, Swatch::Palette& out_palette) {
	Swatch::Image image;
	if(!image.load(set.inpath.c_str())) { return false; }
	if(!image.downsample(set.downsample)) { return false; }
	LOGVER("clustering %dx%d pixels into %d colors over %d rounds", image.width(), image.height(), set.k_count, set.rounds);

	Swatch::RandomSourceMt random(set.seed);
	std::vector<Swatch::PaletteColor> colors = Swatch::kmeans(image.pixels(), random, set.k_count, set.rounds);
	if(!Swatch::classify(std::move(colors), out_palette)) {
		LOGERR("%s has no opaque pixels, no palette available", set.inpath.c_str());
		return false;
	}
	return true;
}

namespace proc {
	bool palette_extract(settings& set) {
		Swatch::Palette palette;
		if(!build_palette(set, palette)) { return false; }
		const std::string report = Swatch::palette_report(palette);

		if(set.outpath.empty()) {
			fwrite(report.data(), 1, report.size(), stdout);
			fflush(stdout);
			return true;
		}

		FILE* fo = fopen(set.outpath.c_str(), "wb");
		if(!fo) { LOGERR("couldn't open output file %s for writing", set.outpath.c_str()); return false; }
		bool ok = fwrite(report.data(), 1, report.size(), fo) == report.size();
		fclose(fo);
		if(!ok) { LOGERR("couldn't write report to %s", set.outpath.c_str()); }
		return ok;
	}

	bool palette_render(settings& set) {
		Swatch::Palette palette;
		if(!build_palette(set, palette)) { return false; }
		LOGINF("dominant color %s, %zu colors", palette.dominant()->hex.c_str(), palette.all_colors.size());
		return Swatch::palette_write_png(palette, set.outpath.c_str(), set.sheet_width, set.sheet_height);
	}
}

typedef bool (*procfn)(settings& set);

struct comInfo {
	const char* const help_string;
	enum Required_type {
		Rno,
		Rfile,
		Rdir,
		Reither,
	};
	Required_type inpath_required;
	Required_type outpath_required;

	procfn fn;
};

static std::map<std::string, comInfo> infoMap{
	{"palette_extract", {"print the palette of an image (or write it to the output path as text)", comInfo::Rfile, comInfo::Rno, proc::palette_extract} },
	{"palette_render", {"render the palette of an image as a .png swatch sheet", comInfo::Rfile, comInfo::Rfile, proc::palette_render} },
};

bool func_handler(settings& set, procfn fn, const std::string& func_name) {
	bool ret = false;
	try {
		if(!set.outpath.empty()) {
			fs::path outpath = fs::u8path(set.outpath).parent_path();
			if(!outpath.empty()) {
				fs::create_directories(outpath);
			}
		}

		std::string short_in = fs::u8path(set.inpath).filename().u8string();
		std::string short_out = fs::u8path(set.outpath).filename().u8string();
		LOGNINF("%s (in %s, out %s)", "executing function", func_name.c_str(), short_in.c_str(), short_out.c_str());

		logging::indent();
		auto start_time = std::chrono::high_resolution_clock::now();
		ret = fn(set);
		auto stop_time = std::chrono::high_resolution_clock::now();
		logging::undent();

		auto duration = std::chrono::duration_cast<std::chrono::microseconds>(stop_time - start_time);
		LOGNINF("---- function returned: %s (%.2fms) ----", func_name.c_str(), (ret) ? "okay" : "error", duration.count() / 1000.0);
	}
	catch(std::exception& e) {
		LOGERR("%s", e.what());
		ret = false;
	}
	return ret;
}

void help_print() {
	LOGALWAYS("most basic interface: 'swatchtools <image> [output.png]'. prints the palette, or renders it if an output .png is given.");
	LOGALWAYS("");
	LOGALWAYS("advanced interface: 'swatchtools <command> -i=<input> -o=<output> (optional: -k=<n> -t=<n> -z=<n> -s=<n> -l<logging> -d=<.extension:.extension> -r)'.");
	LOGALWAYS("    order is irrelevant.");
	LOGALWAYS("");
	LOGALWAYS("option explanation:");
	{
		LOGBLK
		LOGALWAYS("-k, clusters: how many colors k-means looks for (default %d).", Swatch::KMEANS_DEFAULT_K);
		LOGALWAYS("-t, rounds: how many k-means rounds to run, no early exit (default %d).", Swatch::KMEANS_DEFAULT_ROUNDS);
		LOGALWAYS("-z, size: downsample so the longer side has this many pixels before clustering (default 128, 0 = don't).");
		LOGALWAYS("-s, seed: seed for picking the starting colors. 0 or not given picks a random one.");
		LOGALWAYS("-w, sheet size: size of the rendered swatch sheet, for example -w=512:128.");
		LOGALWAYS("-l, logging: there are four logging channels available. Error (e), Warning (w), Info (i), and Verbose (v). use + to turn on a channel, and - to turn one off.");
		LOGALWAYS("    by default, all channels except verbose are enabled.");
		LOGALWAYS("    for example: -l+v turns on verbose.");
		LOGALWAYS("                 -l-ewi turns off error, warning, and info.");
		LOGALWAYS("-d, directory scan: do the operation for every file in the input directory, if it matches the supplied extensions.");
		LOGALWAYS("    for example: -d=.jpg:.png renders every .jpg file, and saves them as .png files.");
		LOGALWAYS("                 -d=_ ignores the extension, and simply does the command for every file");
		LOGALWAYS("-r, recursive: makes the -d option recursive.");
	}

	LOGALWAYS("");
	LOGALWAYS("here are all the currently implemented commands:");
	LOGALWAYS("F = file, D = directory, E = either file/directory, - = not required");
	LOGALWAYS("name / input required - output required / explanation");
	LOGBLK;
	for(const auto& a : infoMap) {
		const auto req_char = [](comInfo::Required_type req) -> char {
			switch(req) {
				case comInfo::Rfile: return 'F';
				case comInfo::Rdir: return 'D';
				case comInfo::Reither: return 'E';
				default: return '-';
			}
		};
		LOGALWAYS("%-20s %c%c %s", a.first.c_str(), req_char(a.second.inpath_required), req_char(a.second.outpath_required), a.second.help_string);
	}
}

static bool parse_number(const std::string& carg, long long min_value, long long& out_value) {
	const std::string value = carg.substr(3, std::string::npos);
	char* end = nullptr;
	long long parsed = strtoll(value.c_str(), &end, 10);
	if(value.empty() || *end != '\0' || parsed < min_value || parsed > INT32_MAX) {
		LOGERR("argument \"%s\" needs a whole number >= %lld", carg.c_str(), min_value);
		return false;
	}
	out_value = parsed;
	return true;
}

//checks the paths a command needs before it runs
static bool check_parameters(comInfo::Required_type req_type, const std::string& path, const char* name, bool should_exist) {
	if(req_type == comInfo::Rno) { return true; }
	if(path.empty()) { LOGNERR("%s path is required", "check_parameters", name); return false; }
	if(!should_exist) { return true; }
	if(!fs::exists(path)) { LOGNERR("%s path does not exist", "check_parameters", name); return false; }
	if(req_type == comInfo::Rdir && !fs::is_directory(path)) { LOGNERR("%s path is not a directory", "check_parameters", name); return false; }
	if(req_type == comInfo::Rfile && !fs::is_regular_file(path)) { LOGNERR("%s path is not a file", "check_parameters", name); return false; }
	LOGNVER("%s path is as required", "check_parameters", name);
	return true;
}

int main_executer(int argc, char* argv[]) {
	if(argc < 2) {
		help_print();
		return 0;
	}

	comInfo* cinf = nullptr;
	settings set;

	std::string search_extension = "";
	std::string save_extension = "";
	std::string found_func_name = "";
	bool recursive = false;

	for(int i = 1; i < argc; i++) {
		if(argv[i][0] == '-' && argv[i][1] != '\0') {
			std::string carg = argv[i];
			long long number = 0;

			if(carg.size() > 2 && carg[2] == '=') { //for all options that require an argument
				switch(carg[1]) {
					case 'i': set.inpath = carg.substr(3, std::string::npos); break;
					case 'o': set.outpath = carg.substr(3, std::string::npos); break;
					case 'k':
						if(!parse_number(carg, 1, number)) { return 1; }
						set.k_count = (int)number;
						break;
					case 't':
						if(!parse_number(carg, 1, number)) { return 1; }
						set.rounds = (int)number;
						break;
					case 'z':
						if(!parse_number(carg, 0, number)) { return 1; }
						set.downsample = (int)number;
						break;
					case 's': {
						const std::string value = carg.substr(3, std::string::npos);
						char* end = nullptr;
						set.seed = strtoull(value.c_str(), &end, 10);
						if(value.empty() || *end != '\0') { LOGERR("argument \"%s\" needs a number", carg.c_str()); return 1; }
						LOGVER("using seed %llu", (unsigned long long)set.seed);
						break;
					}
					case 'w': {
						int w = 0, h = 0;
						if(sscanf(carg.c_str() + 3, "%d:%d", &w, &h) != 2 || w <= 0 || h <= 0) {
							LOGERR("argument \"%s\" should look like -w=512:128", carg.c_str());
							return 1;
						}
						set.sheet_width = w;
						set.sheet_height = h;
						break;
					}
					case 'd': {
						size_t separator = carg.find_first_of(':');
						if(separator != std::string::npos) {
							search_extension = carg.substr(3, separator - 3);
							save_extension = carg.substr(separator + 1, std::string::npos);
							LOGVER("using %s as file save extension", save_extension.c_str());
						}
						else { search_extension = carg.substr(3, std::string::npos); }
						LOGVER("using %s as file mask", search_extension.c_str());
						break;
					}
					default:
						LOGERR("argument \"%s\" is unknown", argv[i]);
						return 1;
				}
			}
			else if(carg[1] == 'r') { recursive = true; }
			else if(carg[1] == 'l') {
				//-l+v turns verbose on, -l-e+v turns error off and verbose on
				if(!logging::set_channels(carg.c_str() + 2)) {
					LOGERR("argument \"%s\" could not be parsed properly", argv[i]);
					return 1;
				}
			}
		}
		else {
			auto found = infoMap.find(argv[i]);
			if(found != infoMap.end()) {
				cinf = &found->second;
				found_func_name = argv[i];
				LOGVER("found command %s in arguments", argv[i]);
			}
		}
	}

	if(!cinf) {
		LOGERR("didn't find operation to do in the arguments supplied!");
		LOGERR("arguments are:");
		for(int i = 0; i < argc; i++) {
			LOGERR("%s", argv[i]);
		}
		return 1;
	}

	//do verbose logging of passed parameters
	LOGVER("input path:  %s", (set.inpath.length()) ? set.inpath.c_str() : "<not given>");
	LOGVER("output path: %s", (set.outpath.length()) ? set.outpath.c_str() : "<not given>");
	if(recursive) { LOGVER("using recursive search"); }

	if(search_extension == "") {
		bool ok = check_parameters(cinf->inpath_required, set.inpath, "input", true);
		ok = ok && check_parameters(cinf->outpath_required, set.outpath, "output", false);
		if(!ok) { return 1; }
		return func_handler(set, cinf->fn, found_func_name) ? 0 : 1;
	}

	if(search_extension == "_") { LOGVER("processing all files in the input folder"); }
	else { LOGVER("processing all files in the input folder with %s as extension", search_extension.c_str()); }
	if(!check_parameters(comInfo::Rdir, set.inpath, "input", true)) { return 1; }

	if(save_extension.empty()) { save_extension = (cinf->fn == proc::palette_render) ? ".png" : ".txt"; }
	const bool care_about_extension = (search_extension == "_") ? false : true;
	const std::string real_in = set.inpath;
	const std::string real_out = set.outpath;
	size_t failed = 0;

	auto func = [&](const fs::path& p) {
		if(!fs::is_regular_file(p)) { return; }
		if(care_about_extension && p.extension() != search_extension) { return; }

		fs::path rel_path = fs::relative(p, fs::u8path(real_in));
		set.inpath = p.u8string();
		if(real_out.empty()) {
			set.outpath = "";
		}
		else {
			fs::path outpath = fs::u8path(real_out);
			outpath /= rel_path.parent_path();
			outpath /= rel_path.stem();
			outpath += save_extension;
			set.outpath = outpath.u8string();
		}

		LOGVER("handling file %s:", rel_path.u8string().c_str());
		if(!check_parameters(cinf->outpath_required, set.outpath, "output", false)) { failed++; return; }
		if(!func_handler(set, cinf->fn, found_func_name)) { failed++; }
	};

	try {
		if(recursive) {
			for(const auto& p : fs::recursive_directory_iterator(fs::u8path(real_in))) {
				func(p.path());
			}
		}
		else {
			for(const auto& p : fs::directory_iterator(fs::u8path(real_in))) {
				func(p.path());
			}
		}
	}
	catch(const fs::filesystem_error& e) {
		LOGERR("error while scanning %s: %s", real_in.c_str(), e.what());
		return 1;
	}

	if(failed) { LOGWAR("%zu files failed", failed); }
	return failed ? 1 : 0;
}

bool drag_drop_solver(const char* char_argument_one, const char* char_argument_two) {
	settings set;
	set.inpath = char_argument_one;
	std::string function = "palette_extract";

	if(char_argument_two) {
		set.outpath = char_argument_two;
		if(fs::u8path(set.outpath).extension() == ".png") { function = "palette_render"; }
	}

	if(!check_parameters(comInfo::Rfile, set.inpath, "input", true)) { return false; }
	return func_handler(set, infoMap.at(function).fn, function);
}

int main(int argc, char* argv[]) {
#ifdef SWATCH_ON_WINDOWS
	HANDLE outhandle = GetStdHandle(STD_OUTPUT_HANDLE);
	DWORD outmode;
	GetConsoleMode(outhandle, &outmode);
	outmode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
	SetConsoleMode(outhandle, outmode);
#endif

#ifdef SWATCH_ON_LINUX
	setlocale(LC_ALL, "C.utf8");
#endif

	auto start_time = std::chrono::high_resolution_clock::now();

	logging::set_channel(logging::Cerror, true);
	logging::set_channel(logging::Cwarning, true);
	logging::set_channel(logging::Cinfo, true);
	logging::set_channel(logging::Cverbose, false);

	int ret = 0;

	bool try_drag_drop = true;
	for(int i = 1; i < argc; i++) {
		if(argv[i][0] == '-' || infoMap.count(argv[i])) { //"advanced" arguments (like -i, -o, etc) or a command name
			try_drag_drop = false;
			break;
		}
	}

	if(try_drag_drop) {
		if(argc == 2)
			ret = drag_drop_solver(argv[1], nullptr) ? 0 : 1;
		else if(argc == 3)
			ret = drag_drop_solver(argv[1], argv[2]) ? 0 : 1;
		else
			help_print();
	}
	else {
		ret = main_executer(argc, argv);
	}

	auto stop_time = std::chrono::high_resolution_clock::now();
	auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(stop_time - start_time);

	LOGINF("done! took %d milliseconds", (int)duration_ms.count());
	LOGALWAYS(""); //print a last newline

	return ret;
}
