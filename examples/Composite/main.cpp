#include <NGIN/Inspect/Inspect.hpp>

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace Demo {
  struct Warehouse;

  struct Part {
    std::string name;
    int quantity{0};
    Warehouse *site{nullptr};

    double UnitPrice() const { throw std::runtime_error("price list unavailable"); }
    double Total(int count, double discount) const { return count * (1.0 - discount); }

    // Defined once Warehouse is complete
    friend void NginReflect(NGIN::Inspect::Tag<Part>, NGIN::Inspect::TypeBuilder<Part> &b);
  };

  struct Warehouse {
    std::string code;
    std::vector<std::shared_ptr<Part>> parts;

    NGIN::Inspect::LazyRange<std::string> Audit() const {
      return {[] { return NGIN::UIntSize{250000}; },
              [](NGIN::UIntSize limit) {
                std::vector<std::string> rows;
                for (NGIN::UIntSize i = 0; i < limit; ++i)
                  rows.push_back("entry " + std::to_string(i));
                return rows;
              }};
    }

    friend void NginReflect(NGIN::Inspect::Tag<Warehouse>, NGIN::Inspect::TypeBuilder<Warehouse> &b) {
      b.SetName("Demo::Warehouse");
      b.Field<&Warehouse::code>();
      b.Field<&Warehouse::parts>();
      b.Property<&Warehouse::Audit>("audit");
    }
  };

  inline void NginReflect(NGIN::Inspect::Tag<Part>, NGIN::Inspect::TypeBuilder<Part> &b) {
    b.SetName("Demo::Part");
    b.Field<&Part::name>();
    b.Field<&Part::quantity>();
    b.Field<&Part::site>("site");
    b.Property<&Part::UnitPrice>("unit_price");
    b.Method<&Part::Total>("total", {"count", "discount"});
  }
}

int main() {
  using namespace NGIN::Inspect;
  SetLogSink(&StderrLogSink);

  Demo::Warehouse site{"WH-1", {}};
  site.parts.push_back(std::make_shared<Demo::Part>(Demo::Part{"M3 bolt", 400, &site}));
  site.parts.push_back(std::make_shared<Demo::Part>(Demo::Part{"M3 nut", 380, &site}));

  Manager manager{InspectOptions{3, 3}};
  auto text = manager.Format("site", site);
  if (!text) {
    std::cerr << "inspection failed: " << text.error().message << "\n";
    return 1;
  }
  std::cout << *text;

  auto partial = Partial::Bind("Demo::Part::Total", {"count", "discount"}, 12);
  std::cout << manager.Format("reprice", partial).value();
  return 0;
}
