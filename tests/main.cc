#include <nexus/run.hh>

int main(int argc, char** args)
{
    return nx::run(argc, args);
}
