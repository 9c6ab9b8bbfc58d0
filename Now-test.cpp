#include "Now.hpp"

#include <iostream>
#include <sstream>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  Now then;

  std::cout << "sizeof(Now) == " << sizeof(Now) << '\n';

  std::stringstream then_str;
  then_str << then;

  Now then_again{then};
  std::stringstream then_again_str;
  then_again_str << then_again;

  CHECK_EQ(then_str.str(), then_again_str.str());

  Now epoch{0};
  CHECK_EQ(std::string(epoch.string()), "Thu, 01 Jan 1970 00:00:00 +0000");

  Now y2k{946684800};
  CHECK_EQ(y2k.sec(), 946684800u);
  CHECK_EQ(std::string(y2k.string()), "Sat, 01 Jan 2000 00:00:00 +0000");

  CHECK_LE(y2k.sec(), Now::seconds());
}
