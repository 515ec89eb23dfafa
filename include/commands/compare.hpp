#pragma once

int cmd_compare(int argc, char** argv);
