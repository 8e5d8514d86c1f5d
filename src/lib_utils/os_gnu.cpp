#include "os.hpp"
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>

using namespace std;

#include <dirent.h>   // opendir
#include <sys/stat.h> // mode constants
#include <unistd.h>   // getpid

int getPid() {
	return getpid();
}

std::string getEnvironmentVariable(string name) {
	const char* value = std::getenv(name.c_str());
	if(!value)
		value = "";
	return value;
}

bool dirExists(string path) {
	struct stat sb;
	return stat(path.c_str(), &sb) == 0 && S_ISDIR(sb.st_mode);
}

bool fileExists(string path) {
	struct stat sb;
	return stat(path.c_str(), &sb) == 0 && S_ISREG(sb.st_mode);
}

void mkdir(string path) {
	if(::mkdir(path.c_str(), 0755) != 0)
		throw runtime_error("couldn't create dir \"" + path + "\": please check you have sufficient permissions");
}

void mkdirIfMissing(string path) {
	if(!dirExists(path))
		mkdir(path);
}

void moveFile(string src, string dst) {
	if(rename(src.c_str(), dst.c_str()))
		throw runtime_error("can't move file \"" + src + "\" to \"" + dst + "\"");
}

void removeFile(string path) {
	if(unlink(path.c_str()))
		throw runtime_error("can't remove file \"" + path + "\"");
}

void removeDir(string path) {
	if(rmdir(path.c_str()))
		throw runtime_error("can't remove dir \"" + path + "\"");
}

vector<string> listDir(string path) {
	shared_ptr<DIR> dir(opendir(path.c_str()), [](DIR* d) { if(d) closedir(d); });
	if(!dir)
		throw runtime_error("can't open dir \"" + path + "\"");

	vector<string> r;
	while(auto entry = readdir(dir.get())) {
		string name = entry->d_name;
		if(name == "." || name == "..")
			continue;
		r.push_back(name);
	}
	return r;
}

string readFile(string path) {
	ifstream fp(path, ios::binary);
	if(!fp.is_open())
		throw runtime_error("can't open \"" + path + "\" for reading");
	stringstream ss;
	ss << fp.rdbuf();
	return ss.str();
}

void writeFile(string path, string const& content) {
	ofstream fp(path, ios::binary);
	if(!fp.is_open())
		throw runtime_error("can't open \"" + path + "\" for writing");
	fp.write(content.data(), content.size());
	fp.close();
	if(!fp)
		throw runtime_error("can't write \"" + path + "\"");
}
