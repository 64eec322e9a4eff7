#ifndef ROSTERSTORE_IO_TESTER_HPP
#define ROSTERSTORE_IO_TESTER_HPP

#include <ostream>
#include <sstream>
#include <string>
#include <vector>

/**
 * Redirects a stream into a streambuf until the object is destroyed.
 */
template <typename StreamType>
class IoTester
{
public:
  IoTester(StreamType& ios):
    stream{},
    ios(ios),
    old_buf(ios.rdbuf())
  {
    // Redirect the given os into our stringstream’s buf
    this->ios.rdbuf(this->stream.rdbuf());
  }
  ~IoTester()
  {
    this->ios.rdbuf(this->old_buf);
  }
  IoTester& operator=(const IoTester&) = delete;
  IoTester& operator=(IoTester&&) = delete;
  IoTester(const IoTester&) = delete;
  IoTester(IoTester&&) = delete;

  std::string str() const
  {
    return this->stream.str();
  }

  /**
   * What has been written so far, one element per line, without the
   * line feeds.
   */
  std::vector<std::string> lines() const
  {
    std::vector<std::string> res;
    std::istringstream is(this->stream.str());
    std::string line;
    while (std::getline(is, line))
      res.push_back(line);
    return res;
  }

  void set_string(const std::string& s)
  {
    this->stream.str(s);
  }

private:
  std::stringstream stream;
  StreamType& ios;
  std::streambuf* const old_buf;
};

#endif //ROSTERSTORE_IO_TESTER_HPP
