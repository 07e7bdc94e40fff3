#ifndef WOOT_EXCEPTION_H
#define WOOT_EXCEPTION_H

#include <stdexcept>
#include <string>

namespace woot
{

class exception : public std::exception
{
  protected:
    std::string message;
    int c;

  public:
    exception (const std::string &_message, int _code = 0);

    virtual const char *what () const noexcept;

    virtual int code () const noexcept;
};

} // woot

#endif // WOOT_EXCEPTION_H
