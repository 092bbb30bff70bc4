#include <NGIN/Inspect/Inspect.hpp>

#include <iostream>
#include <map>
#include <string>
#include <vector>

namespace Demo {
  struct Supplier {
    std::string name;
    std::string password;
    friend void NginReflect(NGIN::Inspect::Tag<Supplier>, NGIN::Inspect::TypeBuilder<Supplier> &b) {
      b.Field<&Supplier::name>();
      b.Field<&Supplier::password>();
    }
  };
}

int main() {
  using namespace NGIN::Inspect;
  std::cout << "Library: " << LibraryName() << "\n";

  // Plain standard containers need no registration
  std::map<std::string, std::vector<int>> stock{{"bolts", {4, 8, 15, 16, 23, 42, 7}}, {"nuts", {}}};
  std::cout << Manager{}.Format("stock", stock).value();

  // Loosely typed data, cycles included
  auto order = Dynamic::MakeMap({{"id", 1042}, {"status", "open"}});
  order->Set("self", order);
  std::cout << Manager{}.Format("order", order).value();
  order->Set("self", nullptr);

  Demo::Supplier supplier{"Acme", "hunter2"};
  std::cout << Manager{}.Format("supplier", supplier).value();

  if (auto missing = Manager{}.Format("supplier", supplier, "html"); !missing)
    std::cout << "html: " << missing.error().message << "\n";
  return 0;
}
