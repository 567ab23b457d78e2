#include <lazy/flat_map.hpp>
#include <lazy/map.hpp>
#include <lazy/value.hpp>
#include <iostream>
#include <string>

using ::std::cerr;

namespace {

int read_sensor()
{
   static int reading = 0;
   reading += 5;
   cerr << "In read_sensor() -> " << reading << ".\n";
   return reading;
}

::lazy::value< ::std::string> describe(int celsius)
{
   cerr << "In describe(" << celsius << ").\n";
   return ::lazy::make_lazy([celsius]() -> ::std::string {
         cerr << "Formatting " << celsius << ".\n";
         return ::std::to_string(celsius) + " C";
      });
}

} // anonymous namespace

int main()
{
   cerr << "Here 1\n";
   auto reading = ::lazy::make_lazy(read_sensor);
   auto doubled = ::lazy::map(reading, [](int x) { return x * 2; });
   auto text = ::lazy::flat_map(doubled, describe);
   cerr << "Here 2, nothing has been evaluated yet.\n";
   for (int i = 0; i < 2; ++i) {
      const ::std::string result = text.get();
      cerr << "text.get() == " << result << '\n';
   }

   const auto fixed = ::lazy::make_value(21);
   const int answer = ::lazy::map(fixed, [](int x) { return x * 2; }).get();
   cerr << "answer == " << answer << '\n';
   return 0;
}
