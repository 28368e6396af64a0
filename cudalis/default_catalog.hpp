#pragma once

#include <string>

namespace cudalis {

// Compatibility table shipped with the binary. Versions are quoted so that
// YAML tooling never reads "3.10" as a number.
// clang-format off
const std::string default_catalog_yaml = R"(
schema_version: "1.0.0"

recipes:
  base_images:
    cpu: "ubuntu:22.04"
    "10.1": "nvidia/cuda:10.1-cudnn7-devel-ubuntu18.04"
    "10.2": "nvidia/cuda:10.2-cudnn8-devel-ubuntu18.04"
    "11.0": "nvidia/cuda:11.0.3-cudnn8-devel-ubuntu20.04"
    "11.3": "nvidia/cuda:11.3.1-cudnn8-devel-ubuntu20.04"
    "11.6": "nvidia/cuda:11.6.2-cudnn8-devel-ubuntu20.04"
    "11.7": "nvidia/cuda:11.7.1-cudnn8-devel-ubuntu22.04"
    "11.8": "nvidia/cuda:11.8.0-cudnn8-devel-ubuntu22.04"
    "12.1": "nvidia/cuda:12.1.1-cudnn8-devel-ubuntu22.04"
    "12.4": "nvidia/cuda:12.4.1-cudnn-devel-ubuntu22.04"

  system_packages: [curl, ca-certificates, git, build-essential, libffi-dev, libssl-dev, zlib1g-dev,
                    liblzma-dev, libbz2-dev, libreadline-dev, libsqlite3-dev, libncurses-dev, tk-dev]

  commands:
    system_packages: |-
      apt-get update && apt-get install -y --no-install-recommends {{ packages }} && rm -rf /var/lib/apt/lists/*
    cuda_environment: |-
      echo 'export PATH=/usr/local/cuda/bin:$PATH' >> ~/.bashrc && echo 'export LD_LIBRARY_PATH=/usr/local/cuda/lib64:$LD_LIBRARY_PATH' >> ~/.bashrc && /usr/local/cuda/bin/nvcc --version
    python_runtime: |-
      curl -fsSL https://pyenv.run | bash && echo 'export PATH="$HOME/.pyenv/bin:$HOME/.pyenv/shims:$PATH"' >> ~/.bashrc && ~/.pyenv/bin/pyenv install -s {{ python }} && ~/.pyenv/bin/pyenv global {{ python }}
    package_manager: |-
      ~/.pyenv/shims/python -m pip install --upgrade pip setuptools wheel
    torch: |-
      ~/.pyenv/shims/pip install torch=={{ torch }} -f https://download.pytorch.org/whl/{{ accelerator }}

  image_reference: "{{ repository }}:{{ python }}-pytorch{{ torch }}-{{ accelerator_version }}"

releases:
  - torch: "2.5.1"
    python: ["3.9", "3.10", "3.11", "3.12"]
    cuda: [cpu, "11.8", "12.1", "12.4"]
    platforms: [linux-x86_64, linux-aarch64]
    cuda_platforms: [linux-x86_64]

  - torch: "2.4.1"
    inherits: "2.5.1"
    python: ["3.8"]

  - torch: "2.3.1"
    python: ["3.8", "3.9", "3.10", "3.11", "3.12"]
    cuda: [cpu, "11.8", "12.1"]
    platforms: [linux-x86_64, linux-aarch64]
    cuda_platforms: [linux-x86_64]

  - torch: "2.2.2"
    inherits: "2.3.1"

  - torch: "2.1.2"
    python: ["3.8", "3.9", "3.10", "3.11"]
    cuda: [cpu, "11.8", "12.1"]
    platforms: [linux-x86_64, linux-aarch64]
    cuda_platforms: [linux-x86_64]

  - torch: "2.0.1"
    python: ["3.8", "3.9", "3.10", "3.11"]
    cuda: [cpu, "11.7", "11.8"]
    platforms: [linux-x86_64, linux-aarch64]
    cuda_platforms: [linux-x86_64]

  - torch: "1.13.1"
    python: ["3.7", "3.8", "3.9", "3.10"]
    cuda: [cpu, "11.6", "11.7"]
    platforms: [linux-x86_64, linux-aarch64]
    cuda_platforms: [linux-x86_64]

  - torch: "1.12.1"
    python: ["3.7", "3.8", "3.9", "3.10"]
    cuda: [cpu, "10.2", "11.3", "11.6"]
    platforms: [linux-x86_64]

  - torch: "1.7.1"
    python: ["3.6", "3.7", "3.8", "3.9"]
    cuda: [cpu, "10.1", "10.2", "11.0"]
    platforms: [linux-x86_64]
)";
// clang-format on

} // namespace cudalis
