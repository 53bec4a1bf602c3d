#include <NGIN/Hierarchy/Hierarchy.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <utility>

namespace Demo
{
  struct Resource : NGIN::Hierarchy::Extends<Resource, NGIN::Hierarchy::Object>
  {
    ~Resource() { std::cout << "  ~Resource\n"; }
  };

  struct File : NGIN::Hierarchy::Extends<File, Resource>
  {
    std::string path{"/tmp/demo.txt"};
    ~File() { std::cout << "  ~File " << path << "\n"; }
  };

  struct Socket : NGIN::Hierarchy::Extends<Socket, Resource>
  {
    int port{8080};
  };
}

int main()
{
  using namespace NGIN::Hierarchy;

  std::cout << "owning handle upcast to Object:\n";
  {
    auto obj = Handle<std::unique_ptr<Demo::File>>{std::make_unique<Demo::File>()}.Upcast<Object>();
    std::cout << "  concrete: " << obj.Info().name << "\n";
  }

  std::cout << "failed downcast keeps the object alive:\n";
  {
    auto res = Handle<std::unique_ptr<Demo::File>>{std::make_unique<Demo::File>()}.Upcast<Demo::Resource>();
    auto sock = std::move(res).Downcast<Demo::Socket>();
    if (!sock)
      std::cout << "  not a Socket, still holding " << sock.error().Info().name << "\n";
  }

  std::cout << "unwrapping back to std::unique_ptr:\n";
  {
    auto res = Handle<std::unique_ptr<Demo::File>>{std::make_unique<Demo::File>()}.Upcast<Demo::Resource>();
    auto refused = std::move(res).IntoPointer();
    if (!refused)
    {
      std::cout << "  refused while viewed as Resource\n";
      auto file = std::move(refused.error()).Downcast<Demo::File>();
      if (file)
      {
        auto ptr = std::move(*file).IntoPointer();
        if (ptr)
          std::cout << "  got unique_ptr<File> for " << (*ptr)->path << "\n";
      }
    }
  }
  return 0;
}
