#include <nexus/run.hh>

int main(int argc, char** argv)
{
    return nx::run(argc, argv);
}
