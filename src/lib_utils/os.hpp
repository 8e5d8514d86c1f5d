#pragma once

#include <string>
#include <vector>

// process
int getPid();
std::string getEnvironmentVariable(std::string name);

// filesystem
bool dirExists(std::string path);
bool fileExists(std::string path);
void mkdir(std::string path);
void mkdirIfMissing(std::string path);
void moveFile(std::string src, std::string dst);
void removeFile(std::string path);
void removeDir(std::string path); // must be empty

// names of the entries of a directory, without "." and ".."
std::vector<std::string> listDir(std::string path);

std::string readFile(std::string path);
void writeFile(std::string path, std::string const& content);
