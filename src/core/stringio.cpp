#include "stringio.hpp"
#include <sstream>

using namespace std;

namespace stringio {

vector<string> &split(const string &s, char delim, vector<string> &elems) {
    stringstream ss(s);
    string item;
    while (std::getline(ss, item, delim)) {
        elems.push_back(item);
    }
    return elems;
}

vector<string> split(const string &s, char delim) {
    vector<string> elems;
    split(s, delim, elems);
    return elems;
}

string join(const vector<string> &elems, const string &sep) {
  string joined;
  for (size_t i=0; i<elems.size(); i++) {
    if (i > 0)
      joined += sep;
    joined += elems[i];
  }
  return joined;
}

string joinArgs(int ac, char* av[]) {
  vector<string> args;
  for (int i=0; i<ac; i++)
    args.push_back(string(av[i]));
  return join(args, " ");
}

bool endsWith(const string &s, const string &suffix) {
  if (suffix.size() > s.size())
    return false;
  return s.compare(s.size()-suffix.size(), suffix.size(), suffix) == 0;
}

} /* namespace stringio */
